#pragma once

#include <QHash>

#include "parking/data/ReservationRepository.hpp"

namespace parking {
namespace data {

class InMemoryReservationRepository : public ReservationRepository
{
public:
    InMemoryReservationRepository();
    ~InMemoryReservationRepository() override;

    std::vector<Reservation> fetchReservations(const QUuid &parkingLotId) const override;
    std::optional<Reservation> findById(const QUuid &id) const override;
    Reservation addReservation(Reservation reservation) override;
    bool updateReservation(const Reservation &reservation) override;
    bool removeReservation(const QUuid &id) override;
    int removeReservationsForLot(const QUuid &parkingLotId) override;

private:
    QHash<QUuid, Reservation> m_reservations;
};

} // namespace data
} // namespace parking
