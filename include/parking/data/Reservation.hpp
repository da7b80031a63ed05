#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>

namespace parking {
namespace data {

enum class ReservationStatus
{
    Active,
    Cancelled,
    Completed,
};

struct ReservationRequest
{
    QString userId;
    QUuid parkingLotId;
    int spaceId = 0;
    QDate date;
    QString startTime; // "HH:MM" or "H:MM AM/PM"
    QString endTime;
    bool recurring = false;
    QString repeatPattern; // "none", "daily" or "weekly"
    QDate endDate;
};

struct ReservationOccurrence
{
    QString userId;
    QUuid parkingLotId;
    int spaceId = 0;
    QDateTime startsAt;
    QDateTime endsAt;
};

struct Reservation
{
    QUuid id = QUuid::createUuid();
    ReservationRequest request;
    ReservationStatus status = ReservationStatus::Active;
    QString userName;
};

QString reservationStatusToString(ReservationStatus status);
ReservationStatus reservationStatusFromString(const QString &value);

} // namespace data
} // namespace parking
