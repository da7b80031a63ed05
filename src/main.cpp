#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "parking/core/AppContext.hpp"
#include "parking/core/Logging.hpp"
#include "parking/core/Settings.hpp"
#include "parking/data/DataProvider.hpp"
#include "parking/data/ParkingLotRepository.hpp"

using namespace parking;

namespace {

QString describe(const engine::SpaceOccupancy &space)
{
    QString line = QStringLiteral("#%1  row %2  col %3  %4  ")
                       .arg(space.spaceId, 3)
                       .arg(space.row)
                       .arg(space.col)
                       .arg(data::spaceTypeToString(space.type), -20);
    if (space.status == engine::SpaceStatus::Occupied) {
        line += QObject::tr("occupied by %1 until %2").arg(space.occupiedBy, space.occupiedUntilText);
    } else {
        line += QObject::tr("available");
    }
    return line;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("ParkMaster"));
    QCoreApplication::setApplicationName(QStringLiteral("ParkMaster"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kParkMasterVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Shows which parking spaces are occupied at a given time."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption atOption(QStringList{QStringLiteral("a"), QStringLiteral("at")},
                                      QObject::tr("Query time as ISO 8601, e.g. 2025-10-20T12:00. Defaults to now."),
                                      QObject::tr("datetime"));
    const QCommandLineOption lotOption(QStringList{QStringLiteral("l"), QStringLiteral("lot")},
                                       QObject::tr("Only show the lot with this name."), QObject::tr("name"));
    parser.addOption(atOption);
    parser.addOption(lotOption);
    parser.process(app);

    QDateTime at = QDateTime::currentDateTime();
    if (parser.isSet(atOption)) {
        at = QDateTime::fromString(parser.value(atOption), Qt::ISODate);
        if (!at.isValid()) {
            qCCritical(lcCore) << "invalid --at value" << parser.value(atOption);
            return 2;
        }
    }

    core::AppContext context(core::Settings::load());
    context.dataProvider().seedDemoData(at.date());

    std::vector<data::ParkingLot> lots;
    if (parser.isSet(lotOption)) {
        const auto lot = context.parkingLotRepository().findByName(parser.value(lotOption));
        if (!lot) {
            qCCritical(lcCore) << "no lot named" << parser.value(lotOption);
            return 1;
        }
        lots.push_back(*lot);
    } else {
        lots = context.parkingLotRepository().fetchLots();
    }

    QTextStream out(stdout);
    int exitCode = 0;
    for (const auto &lot : lots) {
        core::Error error;
        const auto occupancy = context.occupancy(lot.id, at, &error);
        if (!occupancy) {
            qCCritical(lcCore) << "cannot resolve" << lot.name << ":" << error.message;
            exitCode = 1;
            continue;
        }
        out << lot.name << " @ " << at.toString(Qt::ISODate) << '\n';
        for (const auto &space : occupancy->spaces) {
            out << "  " << describe(space) << '\n';
        }
        out << QObject::tr("  total %1, occupied %2, available %3")
                   .arg(occupancy->totalSpots)
                   .arg(occupancy->occupiedSpots)
                   .arg(occupancy->availableSpots)
            << '\n';
    }
    out.flush();
    return exitCode;
}
