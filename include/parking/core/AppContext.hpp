#pragma once

#include <QDateTime>
#include <QUuid>
#include <memory>
#include <optional>

#include "parking/core/Error.hpp"
#include "parking/core/Settings.hpp"
#include "parking/engine/OccupancyResolver.hpp"

namespace parking {
namespace data {
class DataProvider;
class ParkingLotRepository;
class ReservationRepository;
}

namespace core {

class LotEditor;

class AppContext
{
public:
    explicit AppContext(Settings settings = Settings());
    ~AppContext();

    data::DataProvider &dataProvider();
    data::ParkingLotRepository &parkingLotRepository();
    data::ReservationRepository &reservationRepository();
    const Settings &settings() const;

    // Occupancy of a stored lot at `at`, counting active reservations only.
    std::optional<engine::LotOccupancy> occupancy(const QUuid &lotId, const QDateTime &at,
                                                  Error *error = nullptr);

    std::unique_ptr<LotEditor> openEditor(const QUuid &lotId, Error *error = nullptr);
    bool saveEditor(const LotEditor &editor, Error *error = nullptr);

private:
    Settings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    engine::OccupancyResolver m_resolver;
};

} // namespace core
} // namespace parking
