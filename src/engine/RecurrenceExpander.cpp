#include "parking/engine/RecurrenceExpander.hpp"

#include "parking/core/Logging.hpp"

#include <QDateTime>
#include <QObject>
#include <QRegularExpression>

namespace parking {
namespace engine {

namespace {

enum class RepeatPattern
{
    None,
    Daily,
    Weekly,
    Unknown,
};

RepeatPattern effectivePattern(const data::ReservationRequest &request)
{
    if (!request.recurring) {
        return RepeatPattern::None;
    }
    const QString normalized = request.repeatPattern.trimmed().toLower();
    if (normalized.isEmpty() || normalized == QLatin1String("daily")) {
        return RepeatPattern::Daily;
    }
    if (normalized == QLatin1String("weekly")) {
        return RepeatPattern::Weekly;
    }
    if (normalized == QLatin1String("none")) {
        return RepeatPattern::None;
    }
    return RepeatPattern::Unknown;
}

bool checkRequiredFields(const data::ReservationRequest &request, core::Error *error)
{
    QString message;
    if (!request.date.isValid()) {
        message = QObject::tr("Reservation date is required.");
    } else if (request.startTime.trimmed().isEmpty() || request.endTime.trimmed().isEmpty()) {
        message = QObject::tr("Start and end time are required.");
    } else if (request.userId.trimmed().isEmpty()) {
        message = QObject::tr("A user is required.");
    } else if (request.spaceId <= 0) {
        message = QObject::tr("A parking space is required.");
    } else if (request.parkingLotId.isNull()) {
        message = QObject::tr("A parking lot is required.");
    }
    if (message.isEmpty()) {
        return true;
    }
    core::reportError(error, core::ErrorCode::Validation, message);
    return false;
}

QTime resolveTime(const QString &text, Fallback fallback, Expansion &expansion)
{
    if (const auto time = parseTimeOfDay(text)) {
        return *time;
    }
    qCWarning(lcEngine) << "unparseable time" << text << "replaced by" << defaultTimeOfDay().toString(QStringLiteral("HH:mm"));
    expansion.fallbacks.append(fallback);
    return defaultTimeOfDay();
}

} // namespace

QTime defaultTimeOfDay()
{
    return QTime(8, 0);
}

std::optional<QTime> parseTimeOfDay(const QString &text)
{
    static const QRegularExpression pattern(QStringLiteral("(\\d{1,2}):(\\d{2})\\s*(AM|PM)?"),
                                            QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    int hours = match.captured(1).toInt();
    const int minutes = match.captured(2).toInt();
    const QString meridiem = match.captured(3).toUpper();
    if (meridiem == QLatin1String("PM") && hours < 12) {
        hours += 12;
    } else if (meridiem == QLatin1String("AM") && hours == 12) {
        hours = 0;
    }

    const QTime time(hours, minutes);
    if (!time.isValid()) {
        return std::nullopt;
    }
    return time;
}

std::optional<Expansion> buildOccurrences(const data::ReservationRequest &request, core::Error *error)
{
    if (!checkRequiredFields(request, error)) {
        return std::nullopt;
    }

    const RepeatPattern pattern = effectivePattern(request);
    if (pattern != RepeatPattern::None && !request.endDate.isValid()) {
        core::reportError(error, core::ErrorCode::Validation,
                          QObject::tr("An end date is required for recurring reservations."));
        return std::nullopt;
    }

    Expansion expansion;
    const QTime startTime = resolveTime(request.startTime, Fallback::StartTimeDefaulted, expansion);
    const QTime endTime = resolveTime(request.endTime, Fallback::EndTimeDefaulted, expansion);

    data::ReservationOccurrence occurrence;
    occurrence.userId = request.userId;
    occurrence.parkingLotId = request.parkingLotId;
    occurrence.spaceId = request.spaceId;
    occurrence.startsAt = QDateTime(request.date, startTime);
    occurrence.endsAt = QDateTime(request.date, endTime);

    if (pattern == RepeatPattern::None) {
        expansion.occurrences.push_back(occurrence);
        return expansion;
    }

    if (pattern == RepeatPattern::Unknown) {
        qCWarning(lcEngine) << "unknown repeat pattern" << request.repeatPattern << "expanded once";
        expansion.fallbacks.append(Fallback::UnknownRepeatPattern);
    }

    const QDateTime endLimit(request.endDate, QTime(23, 59, 59, 999));
    const int step = pattern == RepeatPattern::Weekly ? 7 : 1;
    while (occurrence.startsAt <= endLimit) {
        expansion.occurrences.push_back(occurrence);
        if (pattern == RepeatPattern::Unknown) {
            break;
        }
        occurrence.startsAt = occurrence.startsAt.addDays(step);
        occurrence.endsAt = occurrence.endsAt.addDays(step);
    }

    qCDebug(lcEngine) << "expanded reservation for space" << request.spaceId << "into"
                      << expansion.occurrences.size() << "occurrences";
    return expansion;
}

} // namespace engine
} // namespace parking
