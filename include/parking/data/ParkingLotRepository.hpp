#pragma once

#include <optional>
#include <vector>

#include "parking/data/ParkingLot.hpp"

namespace parking {
namespace data {

class ParkingLotRepository
{
public:
    virtual ~ParkingLotRepository() = default;

    virtual std::vector<ParkingLot> fetchLots() const = 0;
    virtual std::optional<ParkingLot> findById(const QUuid &id) const = 0;
    virtual std::optional<ParkingLot> findByName(const QString &name) const = 0;
    virtual ParkingLot addLot(ParkingLot lot) = 0;
    virtual bool updateLot(const ParkingLot &lot) = 0;
    virtual bool removeLot(const QUuid &id) = 0;
};

} // namespace data
} // namespace parking
