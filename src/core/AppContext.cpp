#include "parking/core/AppContext.hpp"

#include "parking/core/LotEditor.hpp"
#include "parking/core/Logging.hpp"
#include "parking/data/DataProvider.hpp"
#include "parking/data/ParkingLotRepository.hpp"
#include "parking/data/ReservationRepository.hpp"

#include <QObject>

namespace parking {
namespace core {

AppContext::AppContext(Settings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>())
    , m_resolver(m_settings.occupancyOptions())
{
}

AppContext::~AppContext() = default;

data::DataProvider &AppContext::dataProvider()
{
    return *m_dataProvider;
}

data::ParkingLotRepository &AppContext::parkingLotRepository()
{
    return m_dataProvider->parkingLotRepository();
}

data::ReservationRepository &AppContext::reservationRepository()
{
    return m_dataProvider->reservationRepository();
}

const Settings &AppContext::settings() const
{
    return m_settings;
}

std::optional<engine::LotOccupancy> AppContext::occupancy(const QUuid &lotId, const QDateTime &at, Error *error)
{
    const auto lot = parkingLotRepository().findById(lotId);
    if (!lot) {
        reportError(error, ErrorCode::Validation, QObject::tr("Parking lot not found."));
        return std::nullopt;
    }

    const auto reservations = reservationRepository().fetchReservations(lotId);
    const auto occurrences = engine::OccupancyResolver::activeOccurrences(reservations, lotId);
    const auto names = engine::OccupancyResolver::occupantNames(reservations);
    qCDebug(lcCore) << "resolving" << lot->name << "at" << at << "with" << occurrences.size() << "occurrences";

    return m_resolver.resolve(
        *lot, occurrences, at, [&names](const QString &userId) { return names.value(userId); }, error);
}

std::unique_ptr<LotEditor> AppContext::openEditor(const QUuid &lotId, Error *error)
{
    const auto lot = parkingLotRepository().findById(lotId);
    if (!lot) {
        reportError(error, ErrorCode::Validation, QObject::tr("Parking lot not found."));
        return nullptr;
    }
    auto editor = std::make_unique<LotEditor>(m_settings.historyLimit());
    if (!editor->load(*lot, error)) {
        return nullptr;
    }
    return editor;
}

bool AppContext::saveEditor(const LotEditor &editor, Error *error)
{
    const data::ParkingLot lot = editor.lot();
    if (lot.name.trimmed().isEmpty()) {
        reportError(error, ErrorCode::Validation, QObject::tr("Please enter a lot name before saving."));
        return false;
    }
    if (!parkingLotRepository().updateLot(lot)) {
        reportError(error, ErrorCode::Validation, QObject::tr("Parking lot not found."));
        return false;
    }
    qCInfo(lcCore) << "saved lot" << lot.name << lot.rows << "x" << lot.cols;
    return true;
}

} // namespace core
} // namespace parking
