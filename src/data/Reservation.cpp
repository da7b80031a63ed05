#include "parking/data/Reservation.hpp"

namespace parking {
namespace data {

QString reservationStatusToString(ReservationStatus status)
{
    switch (status) {
    case ReservationStatus::Cancelled:
        return QStringLiteral("cancelled");
    case ReservationStatus::Completed:
        return QStringLiteral("completed");
    case ReservationStatus::Active:
    default:
        return QStringLiteral("active");
    }
}

ReservationStatus reservationStatusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("cancelled") || normalized == QLatin1String("canceled")) {
        return ReservationStatus::Cancelled;
    }
    if (normalized == QLatin1String("completed")) {
        return ReservationStatus::Completed;
    }
    return ReservationStatus::Active;
}

} // namespace data
} // namespace parking
