#include "parking/data/InMemoryReservationRepository.hpp"

#include <algorithm>

namespace parking {
namespace data {

InMemoryReservationRepository::InMemoryReservationRepository() = default;
InMemoryReservationRepository::~InMemoryReservationRepository() = default;

std::vector<Reservation> InMemoryReservationRepository::fetchReservations(const QUuid &parkingLotId) const
{
    std::vector<Reservation> result;
    for (const auto &reservation : m_reservations) {
        if (reservation.request.parkingLotId != parkingLotId) {
            continue;
        }
        result.push_back(reservation);
    }
    // QHash order is arbitrary; callers rely on a stable order for first-match lookups.
    std::sort(result.begin(), result.end(), [](const Reservation &lhs, const Reservation &rhs) {
        if (lhs.request.date == rhs.request.date) {
            return lhs.id < rhs.id;
        }
        return lhs.request.date < rhs.request.date;
    });
    return result;
}

std::optional<Reservation> InMemoryReservationRepository::findById(const QUuid &id) const
{
    if (m_reservations.contains(id)) {
        return m_reservations.value(id);
    }
    return std::nullopt;
}

Reservation InMemoryReservationRepository::addReservation(Reservation reservation)
{
    if (reservation.id.isNull()) {
        reservation.id = QUuid::createUuid();
    }
    m_reservations.insert(reservation.id, reservation);
    return reservation;
}

bool InMemoryReservationRepository::updateReservation(const Reservation &reservation)
{
    if (!m_reservations.contains(reservation.id)) {
        return false;
    }
    m_reservations.insert(reservation.id, reservation);
    return true;
}

bool InMemoryReservationRepository::removeReservation(const QUuid &id)
{
    return m_reservations.remove(id) > 0;
}

int InMemoryReservationRepository::removeReservationsForLot(const QUuid &parkingLotId)
{
    int removed = 0;
    for (auto it = m_reservations.begin(); it != m_reservations.end();) {
        if (it.value().request.parkingLotId == parkingLotId) {
            it = m_reservations.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace data
} // namespace parking
