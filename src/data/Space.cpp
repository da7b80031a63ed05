#include "parking/data/Space.hpp"

namespace parking {
namespace data {

QString spaceTypeToString(SpaceType type)
{
    switch (type) {
    case SpaceType::Visitor:
        return QStringLiteral("visitor");
    case SpaceType::Handicapped:
        return QStringLiteral("handicapped");
    case SpaceType::Authorized:
        return QStringLiteral("authorized personnel");
    case SpaceType::Regular:
    default:
        return QStringLiteral("regular");
    }
}

SpaceType spaceTypeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("visitor")) {
        return SpaceType::Visitor;
    }
    if (normalized == QLatin1String("handicapped")) {
        return SpaceType::Handicapped;
    }
    if (normalized == QLatin1String("authorized personnel") || normalized == QLatin1String("authorized")) {
        return SpaceType::Authorized;
    }
    return SpaceType::Regular;
}

} // namespace data
} // namespace parking
