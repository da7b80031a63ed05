#pragma once

#include <QHash>

#include "parking/data/ParkingLotRepository.hpp"

namespace parking {
namespace data {

class InMemoryParkingLotRepository : public ParkingLotRepository
{
public:
    InMemoryParkingLotRepository();
    ~InMemoryParkingLotRepository() override;

    std::vector<ParkingLot> fetchLots() const override;
    std::optional<ParkingLot> findById(const QUuid &id) const override;
    std::optional<ParkingLot> findByName(const QString &name) const override;
    ParkingLot addLot(ParkingLot lot) override;
    bool updateLot(const ParkingLot &lot) override;
    bool removeLot(const QUuid &id) override;

private:
    QHash<QUuid, ParkingLot> m_lots;
};

} // namespace data
} // namespace parking
