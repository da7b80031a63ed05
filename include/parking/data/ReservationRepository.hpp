#pragma once

#include <optional>
#include <vector>

#include "parking/data/Reservation.hpp"

namespace parking {
namespace data {

class ReservationRepository
{
public:
    virtual ~ReservationRepository() = default;

    virtual std::vector<Reservation> fetchReservations(const QUuid &parkingLotId) const = 0;
    virtual std::optional<Reservation> findById(const QUuid &id) const = 0;
    virtual Reservation addReservation(Reservation reservation) = 0;
    virtual bool updateReservation(const Reservation &reservation) = 0;
    virtual bool removeReservation(const QUuid &id) = 0;
    virtual int removeReservationsForLot(const QUuid &parkingLotId) = 0;
};

} // namespace data
} // namespace parking
