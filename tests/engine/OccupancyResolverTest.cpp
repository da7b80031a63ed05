#include <QtTest/QtTest>

#include "parking/engine/OccupancyResolver.hpp"
#include "parking/engine/SpaceRegistry.hpp"

using namespace parking;
using engine::OccupancyResolver;
using engine::SpaceStatus;

namespace {

data::ParkingLot makeLot(int rows, int cols)
{
    data::ParkingLot lot;
    lot.name = QStringLiteral("Test Lot");
    lot.rows = rows;
    lot.cols = cols;
    lot.spaces = engine::SpaceRegistry::create(rows, cols)->spaces();
    return lot;
}

data::ReservationOccurrence makeOccurrence(const data::ParkingLot &lot, int spaceId, const QString &userId,
                                           const QDateTime &start, const QDateTime &end)
{
    data::ReservationOccurrence occurrence;
    occurrence.userId = userId;
    occurrence.parkingLotId = lot.id;
    occurrence.spaceId = spaceId;
    occurrence.startsAt = start;
    occurrence.endsAt = end;
    return occurrence;
}

const QDate kDay(2025, 10, 20);

} // namespace

class OccupancyResolverTest : public QObject
{
    Q_OBJECT

private slots:
    void inclusiveBounds();
    void occupantDetails();
    void emptyPoolIsAllAvailable();
    void ignoresOtherLots();
    void firstMatchWins();
    void aggregatesAddUp();
    void abortsOnInconsistentRegistry();
    void resolveSingleSpace();
    void activeOccurrencesSkipCancelled();
};

void OccupancyResolverTest::inclusiveBounds()
{
    const auto lot = makeLot(1, 2);
    const std::vector<data::ReservationOccurrence> pool{
        makeOccurrence(lot, 1, QStringLiteral("u-1"), QDateTime(kDay, QTime(9, 0)), QDateTime(kDay, QTime(17, 0))),
    };
    const OccupancyResolver resolver;

    const auto statusAt = [&](const QTime &time) {
        const auto result = resolver.resolve(lot, pool, QDateTime(kDay, time));
        return result->space(1)->status;
    };
    QCOMPARE(statusAt(QTime(12, 0)), SpaceStatus::Occupied);
    QCOMPARE(statusAt(QTime(18, 0)), SpaceStatus::Available);
    QCOMPARE(statusAt(QTime(17, 0)), SpaceStatus::Occupied);
    QCOMPARE(statusAt(QTime(9, 0)), SpaceStatus::Occupied);
    QCOMPARE(statusAt(QTime(8, 59)), SpaceStatus::Available);
}

void OccupancyResolverTest::occupantDetails()
{
    const auto lot = makeLot(1, 2);
    const std::vector<data::ReservationOccurrence> pool{
        makeOccurrence(lot, 1, QStringLiteral("u-1"), QDateTime(kDay, QTime(9, 0)), QDateTime(kDay, QTime(17, 0))),
        makeOccurrence(lot, 2, QStringLiteral("u-2"), QDateTime(kDay, QTime(10, 0)), QDateTime(kDay, QTime(14, 30))),
    };
    const OccupancyResolver resolver;
    const auto names = [](const QString &userId) {
        return userId == QLatin1String("u-1") ? QStringLiteral("Jordan Lee") : QString();
    };

    const auto result = resolver.resolve(lot, pool, QDateTime(kDay, QTime(12, 0)), names);
    QVERIFY(result.has_value());
    const auto *first = result->space(1);
    QVERIFY(first);
    QCOMPARE(first->occupiedBy, QStringLiteral("Jordan Lee"));
    QCOMPARE(first->occupiedUntil, QDateTime(kDay, QTime(17, 0)));
    QCOMPARE(first->occupiedUntilText, QStringLiteral("17:00"));

    const auto *second = result->space(2);
    QVERIFY(second);
    QCOMPARE(second->occupiedBy, QStringLiteral("User u-2"));
    QCOMPARE(second->occupiedUntilText, QStringLiteral("14:30"));

    engine::OccupancyOptions options;
    options.timeFormat = QStringLiteral("hh.mm");
    options.unknownOccupantLabel = QStringLiteral("Guest %1");
    const auto custom = OccupancyResolver(options).resolve(lot, pool, QDateTime(kDay, QTime(12, 0)));
    QCOMPARE(custom->space(1)->occupiedBy, QStringLiteral("Guest u-1"));
    QCOMPARE(custom->space(2)->occupiedUntilText, QStringLiteral("14.30"));
}

void OccupancyResolverTest::emptyPoolIsAllAvailable()
{
    const auto lot = makeLot(2, 3);
    const auto result = OccupancyResolver().resolve(lot, {}, QDateTime(kDay, QTime(12, 0)));
    QVERIFY(result.has_value());
    QCOMPARE(result->spaces.size(), static_cast<size_t>(6));
    for (const auto &space : result->spaces) {
        QCOMPARE(space.status, SpaceStatus::Available);
        QVERIFY(space.occupiedBy.isEmpty());
    }
    QCOMPARE(result->occupiedSpots, 0);
    QCOMPARE(result->availableSpots, 6);
}

void OccupancyResolverTest::ignoresOtherLots()
{
    const auto lot = makeLot(1, 1);
    const auto other = makeLot(1, 1);
    const std::vector<data::ReservationOccurrence> pool{
        makeOccurrence(other, 1, QStringLiteral("u-1"), QDateTime(kDay, QTime(9, 0)), QDateTime(kDay, QTime(17, 0))),
    };
    const auto result = OccupancyResolver().resolve(lot, pool, QDateTime(kDay, QTime(12, 0)));
    QCOMPARE(result->space(1)->status, SpaceStatus::Available);
}

void OccupancyResolverTest::firstMatchWins()
{
    const auto lot = makeLot(1, 1);
    const std::vector<data::ReservationOccurrence> pool{
        makeOccurrence(lot, 1, QStringLiteral("u-1"), QDateTime(kDay, QTime(9, 0)), QDateTime(kDay, QTime(11, 0))),
        makeOccurrence(lot, 1, QStringLiteral("u-2"), QDateTime(kDay, QTime(8, 0)), QDateTime(kDay, QTime(18, 0))),
    };
    const auto result = OccupancyResolver().resolve(lot, pool, QDateTime(kDay, QTime(10, 0)));
    QCOMPARE(result->space(1)->occupiedBy, QStringLiteral("User u-1"));
    QCOMPARE(result->occupiedSpots, 1);
}

void OccupancyResolverTest::aggregatesAddUp()
{
    const auto lot = makeLot(3, 4);
    std::vector<data::ReservationOccurrence> pool;
    for (int id = 1; id <= 12; id += 3) {
        pool.push_back(makeOccurrence(lot, id, QStringLiteral("u-%1").arg(id), QDateTime(kDay, QTime(6, 0)),
                                      QDateTime(kDay, QTime(6 + id, 0))));
    }
    for (int hour = 5; hour <= 20; ++hour) {
        const auto result = OccupancyResolver().resolve(lot, pool, QDateTime(kDay, QTime(hour, 0)));
        QVERIFY(result.has_value());
        QCOMPARE(result->totalSpots, 12);
        QCOMPARE(result->availableSpots + result->occupiedSpots, result->totalSpots);
    }
    const auto morning = OccupancyResolver().resolve(lot, pool, QDateTime(kDay, QTime(7, 0)));
    QCOMPARE(morning->occupiedSpots, 4);
}

void OccupancyResolverTest::abortsOnInconsistentRegistry()
{
    auto lot = makeLot(2, 2);
    lot.cols = 3;

    core::Error error;
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("occupancy query aborted")));
    QVERIFY(!OccupancyResolver().resolve(lot, {}, QDateTime(kDay, QTime(12, 0)), {}, &error));
    QCOMPARE(error.code, core::ErrorCode::InconsistentState);
    QVERIFY(error.message.contains(QStringLiteral("6")));
}

void OccupancyResolverTest::resolveSingleSpace()
{
    const auto lot = makeLot(2, 2);
    const std::vector<data::ReservationOccurrence> pool{
        makeOccurrence(lot, 4, QStringLiteral("u-9"), QDateTime(kDay, QTime(9, 0)), QDateTime(kDay, QTime(17, 0))),
    };
    const OccupancyResolver resolver;

    const auto space = resolver.resolveSpace(lot, 4, pool, QDateTime(kDay, QTime(10, 0)));
    QVERIFY(space.has_value());
    QCOMPARE(space->status, SpaceStatus::Occupied);
    QCOMPARE(space->row, 1);
    QCOMPARE(space->col, 1);

    core::Error error;
    QVERIFY(!resolver.resolveSpace(lot, 5, pool, QDateTime(kDay, QTime(10, 0)), {}, &error));
    QCOMPARE(error.code, core::ErrorCode::InconsistentState);
}

void OccupancyResolverTest::activeOccurrencesSkipCancelled()
{
    const auto lot = makeLot(1, 3);

    data::Reservation active;
    active.userName = QStringLiteral("Robin");
    active.request.userId = QStringLiteral("u-1");
    active.request.parkingLotId = lot.id;
    active.request.spaceId = 1;
    active.request.date = kDay;
    active.request.startTime = QStringLiteral("09:00");
    active.request.endTime = QStringLiteral("17:00");

    data::Reservation cancelled = active;
    cancelled.request.spaceId = 2;
    cancelled.status = data::ReservationStatus::Cancelled;

    data::Reservation completed = active;
    completed.request.spaceId = 3;
    completed.status = data::ReservationStatus::Completed;

    data::Reservation invalid = active;
    invalid.request.userId.clear();

    data::Reservation elsewhere = active;
    elsewhere.request.parkingLotId = QUuid::createUuid();

    const std::vector<data::Reservation> reservations{active, cancelled, completed, invalid, elsewhere};
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("skipping reservation")));
    const auto occurrences = OccupancyResolver::activeOccurrences(reservations, lot.id);
    QCOMPARE(occurrences.size(), static_cast<size_t>(1));
    QCOMPARE(occurrences.front().spaceId, 1);

    const auto names = OccupancyResolver::occupantNames(reservations);
    QCOMPARE(names.value(QStringLiteral("u-1")), QStringLiteral("Robin"));

    const auto result = OccupancyResolver().resolve(lot, occurrences, QDateTime(kDay, QTime(12, 0)));
    QCOMPARE(result->occupiedSpots, 1);
    QCOMPARE(result->space(2)->status, SpaceStatus::Available);
    QCOMPARE(result->space(3)->status, SpaceStatus::Available);
}

QTEST_GUILESS_MAIN(OccupancyResolverTest)
#include "OccupancyResolverTest.moc"
