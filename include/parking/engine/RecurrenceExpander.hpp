#pragma once

#include <QString>
#include <QTime>
#include <QVector>
#include <optional>
#include <vector>

#include "parking/core/Error.hpp"
#include "parking/data/Reservation.hpp"

namespace parking {
namespace engine {

// Substitutions made while expanding a request. They change the output, so
// callers may want to surface them.
enum class Fallback
{
    StartTimeDefaulted,
    EndTimeDefaulted,
    UnknownRepeatPattern,
};

struct Expansion
{
    std::vector<data::ReservationOccurrence> occurrences;
    QVector<Fallback> fallbacks;

    bool hasFallback(Fallback fallback) const { return fallbacks.contains(fallback); }
};

// Time used when a time-of-day string cannot be parsed.
QTime defaultTimeOfDay();

// Accepts "17:00", "8:30", "08:30 AM" and "12:15 pm".
std::optional<QTime> parseTimeOfDay(const QString &text);

// Expands a request into occurrences ordered by start. A daily or weekly
// request repeats until the end of `endDate`, inclusive.
std::optional<Expansion> buildOccurrences(const data::ReservationRequest &request, core::Error *error = nullptr);

} // namespace engine
} // namespace parking
