#pragma once

#include <QString>

namespace parking {
namespace data {

enum class SpaceType
{
    Regular,
    Visitor,
    Handicapped,
    Authorized,
};

struct Space
{
    int id = 0;
    int row = 0;
    int col = 0;
    SpaceType type = SpaceType::Regular;
};

QString spaceTypeToString(SpaceType type);
SpaceType spaceTypeFromString(const QString &value);

} // namespace data
} // namespace parking
