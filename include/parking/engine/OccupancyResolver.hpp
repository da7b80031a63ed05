#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <QUuid>
#include <functional>
#include <optional>
#include <vector>

#include "parking/core/Error.hpp"
#include "parking/data/ParkingLot.hpp"
#include "parking/data/Reservation.hpp"

namespace parking {
namespace engine {

enum class SpaceStatus
{
    Available,
    Occupied,
};

struct SpaceOccupancy
{
    int spaceId = 0;
    int row = 0;
    int col = 0;
    data::SpaceType type = data::SpaceType::Regular;
    SpaceStatus status = SpaceStatus::Available;
    QString occupiedBy;
    QDateTime occupiedUntil;
    QString occupiedUntilText;
};

struct LotOccupancy
{
    QUuid lotId;
    std::vector<SpaceOccupancy> spaces;
    int totalSpots = 0;
    int occupiedSpots = 0;
    int availableSpots = 0;

    const SpaceOccupancy *space(int spaceId) const;
};

struct OccupancyOptions
{
    QString timeFormat = QStringLiteral("HH:mm");
    QString unknownOccupantLabel = QStringLiteral("User %1"); // %1 is the user id
};

// Maps a user id to the name shown for an occupied space.
using OccupantNameLookup = std::function<QString(const QString &userId)>;

class OccupancyResolver
{
public:
    explicit OccupancyResolver(OccupancyOptions options = {});

    const OccupancyOptions &options() const;

    // Classifies every space of `lot` at `at`. An occurrence occupies its space
    // from startsAt to endsAt, both inclusive. When several occurrences match,
    // the first one in `occurrences` wins. Fails when the lot's spaces do not
    // match its dimensions.
    std::optional<LotOccupancy> resolve(const data::ParkingLot &lot,
                                        const std::vector<data::ReservationOccurrence> &occurrences,
                                        const QDateTime &at,
                                        const OccupantNameLookup &names = {},
                                        core::Error *error = nullptr) const;

    std::optional<SpaceOccupancy> resolveSpace(const data::ParkingLot &lot,
                                               int spaceId,
                                               const std::vector<data::ReservationOccurrence> &occurrences,
                                               const QDateTime &at,
                                               const OccupantNameLookup &names = {},
                                               core::Error *error = nullptr) const;

    // Occurrences of the active reservations of `parkingLotId`. Requests that
    // fail validation are skipped.
    static std::vector<data::ReservationOccurrence> activeOccurrences(const std::vector<data::Reservation> &reservations,
                                                                      const QUuid &parkingLotId);

    static QHash<QString, QString> occupantNames(const std::vector<data::Reservation> &reservations);

private:
    SpaceOccupancy classify(const data::Space &space,
                            const QUuid &lotId,
                            const std::vector<data::ReservationOccurrence> &occurrences,
                            const QDateTime &at,
                            const OccupantNameLookup &names) const;

    OccupancyOptions m_options;
};

} // namespace engine
} // namespace parking
