#pragma once

#include <QString>
#include <cstddef>

#include "parking/engine/OccupancyResolver.hpp"

class QSettings;

namespace parking {
namespace core {

class Settings
{
public:
    Settings();

    // Reads from the application's QSettings store, falling back to defaults.
    static Settings load();
    static Settings load(const QSettings &store);
    void save(QSettings &store) const;

    const QString &timeFormat() const;
    void setTimeFormat(const QString &format);

    const QString &unknownOccupantLabel() const;
    void setUnknownOccupantLabel(const QString &label);

    std::size_t historyLimit() const;
    void setHistoryLimit(std::size_t limit);

    engine::OccupancyOptions occupancyOptions() const;

private:
    QString m_timeFormat;
    QString m_unknownOccupantLabel;
    std::size_t m_historyLimit = 100;
};

} // namespace core
} // namespace parking
