#include "parking/core/Settings.hpp"

#include "parking/core/Logging.hpp"

#include <QSettings>
#include <QtGlobal>

namespace parking {
namespace core {

namespace {
constexpr auto KEY_TIME_FORMAT = "occupancy/timeFormat";
constexpr auto KEY_UNKNOWN_OCCUPANT = "occupancy/unknownOccupantLabel";
constexpr auto KEY_HISTORY_LIMIT = "editor/historyLimit";
constexpr int MAX_HISTORY_LIMIT = 10000;
} // namespace

Settings::Settings()
    : m_timeFormat(engine::OccupancyOptions{}.timeFormat)
    , m_unknownOccupantLabel(engine::OccupancyOptions{}.unknownOccupantLabel)
{
}

Settings Settings::load()
{
    QSettings store;
    return load(store);
}

Settings Settings::load(const QSettings &store)
{
    Settings settings;
    const QString format = store.value(QLatin1String(KEY_TIME_FORMAT), settings.m_timeFormat).toString();
    if (!format.trimmed().isEmpty()) {
        settings.m_timeFormat = format;
    }
    const QString label = store.value(QLatin1String(KEY_UNKNOWN_OCCUPANT), settings.m_unknownOccupantLabel).toString();
    if (label.contains(QLatin1String("%1"))) {
        settings.m_unknownOccupantLabel = label;
    } else {
        qCWarning(lcCore) << "ignoring occupant label without %1 placeholder:" << label;
    }
    bool ok = false;
    const int limit = store.value(QLatin1String(KEY_HISTORY_LIMIT), static_cast<int>(settings.m_historyLimit)).toInt(&ok);
    if (ok) {
        settings.m_historyLimit = static_cast<std::size_t>(qBound(1, limit, MAX_HISTORY_LIMIT));
    } else {
        qCWarning(lcCore) << "ignoring non-numeric history limit";
    }
    return settings;
}

void Settings::save(QSettings &store) const
{
    store.setValue(QLatin1String(KEY_TIME_FORMAT), m_timeFormat);
    store.setValue(QLatin1String(KEY_UNKNOWN_OCCUPANT), m_unknownOccupantLabel);
    store.setValue(QLatin1String(KEY_HISTORY_LIMIT), static_cast<int>(m_historyLimit));
}

const QString &Settings::timeFormat() const
{
    return m_timeFormat;
}

void Settings::setTimeFormat(const QString &format)
{
    m_timeFormat = format;
}

const QString &Settings::unknownOccupantLabel() const
{
    return m_unknownOccupantLabel;
}

void Settings::setUnknownOccupantLabel(const QString &label)
{
    m_unknownOccupantLabel = label;
}

std::size_t Settings::historyLimit() const
{
    return m_historyLimit;
}

void Settings::setHistoryLimit(std::size_t limit)
{
    m_historyLimit = limit;
}

engine::OccupancyOptions Settings::occupancyOptions() const
{
    engine::OccupancyOptions options;
    options.timeFormat = m_timeFormat;
    options.unknownOccupantLabel = m_unknownOccupantLabel;
    return options;
}

} // namespace core
} // namespace parking
