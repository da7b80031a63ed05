#include "parking/data/InMemoryParkingLotRepository.hpp"

#include "parking/core/Logging.hpp"

#include <algorithm>

namespace parking {
namespace data {

InMemoryParkingLotRepository::InMemoryParkingLotRepository() = default;
InMemoryParkingLotRepository::~InMemoryParkingLotRepository() = default;

std::vector<ParkingLot> InMemoryParkingLotRepository::fetchLots() const
{
    std::vector<ParkingLot> lots;
    lots.reserve(static_cast<size_t>(m_lots.size()));
    for (const auto &lot : m_lots) {
        lots.push_back(lot);
    }
    std::sort(lots.begin(), lots.end(), [](const ParkingLot &lhs, const ParkingLot &rhs) {
        return QString::localeAwareCompare(lhs.name, rhs.name) < 0;
    });
    return lots;
}

std::optional<ParkingLot> InMemoryParkingLotRepository::findById(const QUuid &id) const
{
    if (m_lots.contains(id)) {
        return m_lots.value(id);
    }
    return std::nullopt;
}

std::optional<ParkingLot> InMemoryParkingLotRepository::findByName(const QString &name) const
{
    for (const auto &lot : m_lots) {
        if (lot.name.compare(name, Qt::CaseInsensitive) == 0) {
            return lot;
        }
    }
    return std::nullopt;
}

ParkingLot InMemoryParkingLotRepository::addLot(ParkingLot lot)
{
    if (lot.id.isNull()) {
        lot.id = QUuid::createUuid();
    }
    m_lots.insert(lot.id, lot);
    qCDebug(lcData) << "stored lot" << lot.name << lot.rows << "x" << lot.cols;
    return lot;
}

bool InMemoryParkingLotRepository::updateLot(const ParkingLot &lot)
{
    if (!m_lots.contains(lot.id)) {
        return false;
    }
    m_lots.insert(lot.id, lot);
    return true;
}

bool InMemoryParkingLotRepository::removeLot(const QUuid &id)
{
    return m_lots.remove(id) > 0;
}

} // namespace data
} // namespace parking
