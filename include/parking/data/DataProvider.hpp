#pragma once

#include <QDate>
#include <memory>

namespace parking {
namespace data {

class ParkingLotRepository;
class ReservationRepository;

class DataProvider
{
public:
    DataProvider();
    ~DataProvider();

    ParkingLotRepository &parkingLotRepository();
    ReservationRepository &reservationRepository();

    // Adds a sample lot with reservations around `today` when no lot exists yet.
    void seedDemoData(const QDate &today);

private:
    std::unique_ptr<ParkingLotRepository> m_parkingLotRepository;
    std::unique_ptr<ReservationRepository> m_reservationRepository;
};

} // namespace data
} // namespace parking
