#include "parking/engine/OccupancyResolver.hpp"

#include "parking/core/Logging.hpp"
#include "parking/engine/RecurrenceExpander.hpp"
#include "parking/engine/SpaceRegistry.hpp"

#include <QObject>
#include <algorithm>

namespace parking {
namespace engine {

const SpaceOccupancy *LotOccupancy::space(int spaceId) const
{
    const auto it = std::find_if(spaces.begin(), spaces.end(), [spaceId](const SpaceOccupancy &entry) {
        return entry.spaceId == spaceId;
    });
    return it == spaces.end() ? nullptr : &*it;
}

OccupancyResolver::OccupancyResolver(OccupancyOptions options)
    : m_options(std::move(options))
{
}

const OccupancyOptions &OccupancyResolver::options() const
{
    return m_options;
}

std::optional<LotOccupancy> OccupancyResolver::resolve(const data::ParkingLot &lot,
                                                       const std::vector<data::ReservationOccurrence> &occurrences,
                                                       const QDateTime &at,
                                                       const OccupantNameLookup &names,
                                                       core::Error *error) const
{
    core::Error registryError;
    if (!SpaceRegistry::verify(lot, &registryError)) {
        qCWarning(lcEngine) << "occupancy query aborted:" << registryError.message;
        core::reportError(error, registryError.code, registryError.message);
        return std::nullopt;
    }

    LotOccupancy result;
    result.lotId = lot.id;
    result.spaces.reserve(lot.spaces.size());
    for (const auto &space : lot.spaces) {
        result.spaces.push_back(classify(space, lot.id, occurrences, at, names));
    }

    result.totalSpots = lot.rows * lot.cols;
    result.occupiedSpots = static_cast<int>(std::count_if(result.spaces.begin(), result.spaces.end(),
                                                          [](const SpaceOccupancy &entry) {
                                                              return entry.status == SpaceStatus::Occupied;
                                                          }));
    result.availableSpots = result.totalSpots - result.occupiedSpots;
    return result;
}

std::optional<SpaceOccupancy> OccupancyResolver::resolveSpace(const data::ParkingLot &lot,
                                                              int spaceId,
                                                              const std::vector<data::ReservationOccurrence> &occurrences,
                                                              const QDateTime &at,
                                                              const OccupantNameLookup &names,
                                                              core::Error *error) const
{
    if (!SpaceRegistry::verify(lot, error)) {
        return std::nullopt;
    }
    const auto it = std::find_if(lot.spaces.begin(), lot.spaces.end(), [spaceId](const data::Space &space) {
        return space.id == spaceId;
    });
    if (it == lot.spaces.end()) {
        core::reportError(error, core::ErrorCode::InconsistentState,
                          QObject::tr("Space %1 does not exist in lot \"%2\".").arg(spaceId).arg(lot.name));
        return std::nullopt;
    }
    return classify(*it, lot.id, occurrences, at, names);
}

std::vector<data::ReservationOccurrence> OccupancyResolver::activeOccurrences(
    const std::vector<data::Reservation> &reservations, const QUuid &parkingLotId)
{
    std::vector<data::ReservationOccurrence> result;
    for (const auto &reservation : reservations) {
        if (reservation.status != data::ReservationStatus::Active
            || reservation.request.parkingLotId != parkingLotId) {
            continue;
        }
        core::Error error;
        const auto expansion = buildOccurrences(reservation.request, &error);
        if (!expansion) {
            qCWarning(lcEngine) << "skipping reservation" << reservation.id << ":" << error.message;
            continue;
        }
        result.insert(result.end(), expansion->occurrences.begin(), expansion->occurrences.end());
    }
    return result;
}

QHash<QString, QString> OccupancyResolver::occupantNames(const std::vector<data::Reservation> &reservations)
{
    QHash<QString, QString> names;
    for (const auto &reservation : reservations) {
        if (!reservation.userName.isEmpty()) {
            names.insert(reservation.request.userId, reservation.userName);
        }
    }
    return names;
}

SpaceOccupancy OccupancyResolver::classify(const data::Space &space,
                                           const QUuid &lotId,
                                           const std::vector<data::ReservationOccurrence> &occurrences,
                                           const QDateTime &at,
                                           const OccupantNameLookup &names) const
{
    SpaceOccupancy entry;
    entry.spaceId = space.id;
    entry.row = space.row;
    entry.col = space.col;
    entry.type = space.type;

    const auto match = std::find_if(occurrences.begin(), occurrences.end(),
                                    [&](const data::ReservationOccurrence &occurrence) {
                                        return occurrence.parkingLotId == lotId && occurrence.spaceId == space.id
                                            && occurrence.startsAt <= at && at <= occurrence.endsAt;
                                    });
    if (match == occurrences.end()) {
        return entry;
    }

    entry.status = SpaceStatus::Occupied;
    entry.occupiedBy = names ? names(match->userId) : QString();
    if (entry.occupiedBy.isEmpty()) {
        entry.occupiedBy = m_options.unknownOccupantLabel.arg(match->userId);
    }
    entry.occupiedUntil = match->endsAt;
    entry.occupiedUntilText = match->endsAt.toString(m_options.timeFormat);
    return entry;
}

} // namespace engine
} // namespace parking
