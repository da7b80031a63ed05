#include <QtTest/QtTest>

#include "parking/core/AppContext.hpp"
#include "parking/core/LotEditor.hpp"
#include "parking/data/DataProvider.hpp"
#include "parking/data/ParkingLotRepository.hpp"

using namespace parking;

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void demoLotOccupancy();
    void unknownLot();
    void editAndSave();
};

void AppContextTest::demoLotOccupancy()
{
    const QDate today(2025, 10, 20);
    core::AppContext context;
    context.dataProvider().seedDemoData(today);

    const auto lot = context.parkingLotRepository().findByName(QStringLiteral("North Garage"));
    QVERIFY(lot.has_value());
    QCOMPARE(lot->spaces.size(), static_cast<size_t>(24));

    const auto occupancy = context.occupancy(lot->id, QDateTime(today, QTime(12, 0)));
    QVERIFY(occupancy.has_value());
    QCOMPARE(occupancy->totalSpots, 24);
    QCOMPARE(occupancy->occupiedSpots, 3);
    QCOMPARE(occupancy->availableSpots, 21);

    QCOMPARE(occupancy->space(3)->occupiedBy, QStringLiteral("Alex Morgan"));
    QCOMPARE(occupancy->space(3)->occupiedUntilText, QStringLiteral("17:30"));
    QCOMPARE(occupancy->space(6)->occupiedBy, QStringLiteral("Sam Patel"));
    QCOMPARE(occupancy->space(6)->occupiedUntilText, QStringLiteral("13:00"));
    QCOMPARE(occupancy->space(7)->status, engine::SpaceStatus::Available);
    QCOMPARE(occupancy->space(19)->occupiedBy, QStringLiteral("User u-1003"));

    const auto evening = context.occupancy(lot->id, QDateTime(today, QTime(20, 0)));
    QVERIFY(evening.has_value());
    QCOMPARE(evening->occupiedSpots, 0);

    // Seeding twice keeps a single lot.
    context.dataProvider().seedDemoData(today);
    QCOMPARE(context.parkingLotRepository().fetchLots().size(), static_cast<size_t>(1));
}

void AppContextTest::unknownLot()
{
    core::AppContext context;
    core::Error error;
    QVERIFY(!context.occupancy(QUuid::createUuid(), QDateTime::currentDateTime(), &error));
    QCOMPARE(error.code, core::ErrorCode::Validation);
    QVERIFY(!context.openEditor(QUuid::createUuid()));
}

void AppContextTest::editAndSave()
{
    core::AppContext context;
    context.dataProvider().seedDemoData(QDate(2025, 10, 20));
    const auto lot = context.parkingLotRepository().fetchLots().front();

    auto editor = context.openEditor(lot.id);
    QVERIFY(editor);
    QCOMPARE(editor->lot().mergedAisles, QSet<int>({1}));
    QVERIFY(editor->resize(4, 7));
    QVERIFY(editor->resetMerges());
    QVERIFY(context.saveEditor(*editor));

    const auto saved = context.parkingLotRepository().findById(lot.id);
    QVERIFY(saved.has_value());
    QCOMPARE(saved->cols, 7);
    QCOMPARE(saved->spaces.size(), static_cast<size_t>(28));
    QVERIFY(saved->mergedAisles.isEmpty());
    // Space (0, 0) was seeded as handicapped.
    QCOMPARE(saved->spaces.front().type, data::SpaceType::Handicapped);

    core::Error error;
    editor->rename(QStringLiteral(" "));
    QVERIFY(!context.saveEditor(*editor, &error));
    QCOMPARE(error.code, core::ErrorCode::Validation);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
