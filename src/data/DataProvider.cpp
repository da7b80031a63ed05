#include "parking/data/DataProvider.hpp"

#include "parking/core/Logging.hpp"
#include "parking/data/InMemoryParkingLotRepository.hpp"
#include "parking/data/InMemoryReservationRepository.hpp"
#include "parking/engine/SpaceRegistry.hpp"

#include <QObject>

namespace parking {
namespace data {

DataProvider::DataProvider()
    : m_parkingLotRepository(std::make_unique<InMemoryParkingLotRepository>())
    , m_reservationRepository(std::make_unique<InMemoryReservationRepository>())
{
}

DataProvider::~DataProvider() = default;

ParkingLotRepository &DataProvider::parkingLotRepository()
{
    return *m_parkingLotRepository;
}

ReservationRepository &DataProvider::reservationRepository()
{
    return *m_reservationRepository;
}

void DataProvider::seedDemoData(const QDate &today)
{
    if (!m_parkingLotRepository->fetchLots().empty()) {
        return;
    }

    auto registry = engine::SpaceRegistry::create(4, 6);
    if (!registry) {
        return;
    }
    registry->setType(0, 0, SpaceType::Handicapped);
    registry->setType(0, 1, SpaceType::Handicapped);
    registry->setType(0, 5, SpaceType::Visitor);
    registry->setType(3, 0, SpaceType::Authorized);

    ParkingLot north;
    north.name = QObject::tr("North Garage");
    north.rows = registry->rows();
    north.cols = registry->cols();
    north.spaces = registry->spaces();
    north.mergedAisles = {1};
    north = m_parkingLotRepository->addLot(std::move(north));

    Reservation commuter;
    commuter.userName = QObject::tr("Alex Morgan");
    commuter.request.userId = QStringLiteral("u-1001");
    commuter.request.parkingLotId = north.id;
    commuter.request.spaceId = 3;
    commuter.request.date = today.addDays(-2);
    commuter.request.startTime = QStringLiteral("08:00");
    commuter.request.endTime = QStringLiteral("17:30");
    commuter.request.recurring = true;
    commuter.request.repeatPattern = QStringLiteral("daily");
    commuter.request.endDate = today.addDays(4);

    Reservation visitor;
    visitor.userName = QObject::tr("Sam Patel");
    visitor.request.userId = QStringLiteral("u-1002");
    visitor.request.parkingLotId = north.id;
    visitor.request.spaceId = 6;
    visitor.request.date = today;
    visitor.request.startTime = QStringLiteral("9:00 AM");
    visitor.request.endTime = QStringLiteral("1:00 PM");

    Reservation weekly;
    weekly.request.userId = QStringLiteral("u-1003");
    weekly.request.parkingLotId = north.id;
    weekly.request.spaceId = 19;
    weekly.request.date = today.addDays(-7);
    weekly.request.startTime = QStringLiteral("07:00");
    weekly.request.endTime = QStringLiteral("19:00");
    weekly.request.recurring = true;
    weekly.request.repeatPattern = QStringLiteral("weekly");
    weekly.request.endDate = today.addDays(21);

    Reservation cancelled = visitor;
    cancelled.id = QUuid::createUuid();
    cancelled.request.spaceId = 7;
    cancelled.status = ReservationStatus::Cancelled;

    m_reservationRepository->addReservation(std::move(commuter));
    m_reservationRepository->addReservation(std::move(visitor));
    m_reservationRepository->addReservation(std::move(weekly));
    m_reservationRepository->addReservation(std::move(cancelled));

    qCInfo(lcData) << "seeded demo lot" << north.name;
}

} // namespace data
} // namespace parking
