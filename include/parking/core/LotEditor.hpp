#pragma once

#include <QSet>
#include <QString>
#include <QUuid>
#include <cstddef>

#include "parking/core/Error.hpp"
#include "parking/core/LayoutHistory.hpp"
#include "parking/data/ParkingLot.hpp"
#include "parking/engine/LotGeometry.hpp"
#include "parking/engine/SpaceRegistry.hpp"

namespace parking {
namespace core {

struct LotLayoutState
{
    int rows = 0;
    int cols = 0;
    QSet<int> mergedAisles;
    engine::SpaceRegistry registry;
};

class LotEditor
{
public:
    explicit LotEditor(std::size_t historyLimit = 100);

    LotEditor(const LotEditor &) = delete;
    LotEditor &operator=(const LotEditor &) = delete;

    bool create(const QString &name, int rows, int cols, Error *error = nullptr);
    bool load(const data::ParkingLot &lot, Error *error = nullptr);

    bool resize(int rows, int cols, Error *error = nullptr);
    bool mergeRows(int first, int second, Error *error = nullptr);
    bool mergeRows(const QString &first, const QString &second, Error *error = nullptr);
    bool resetMerges();
    bool setSpaceType(int spaceId, data::SpaceType type, Error *error = nullptr);
    void rename(const QString &name);

    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;
    const LayoutHistory &history() const;

    data::ParkingLot lot() const;
    engine::LotGeometry geometry() const;

private:
    bool applyMerge(int aisle, const QString &text, Error *error);

    QUuid m_lotId;
    QString m_name;
    LotLayoutState m_state;
    LayoutHistory m_history;
};

} // namespace core
} // namespace parking
