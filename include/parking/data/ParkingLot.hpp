#pragma once

#include <QSet>
#include <QString>
#include <QUuid>
#include <vector>

#include "parking/data/Space.hpp"

namespace parking {
namespace data {

struct ParkingLot
{
    QUuid id = QUuid::createUuid();
    QString name;
    int rows = 0;
    int cols = 0;
    std::vector<Space> spaces;
    QSet<int> mergedAisles; // row index r means the aisle between r and r + 1
};

} // namespace data
} // namespace parking
