#include "parking/core/LotEditor.hpp"

#include "parking/core/LayoutCommand.hpp"
#include "parking/core/Logging.hpp"

#include <QObject>
#include <functional>

namespace parking {
namespace core {

namespace {

// Records the layout before the edit and restores it on revert.
class SnapshotCommand : public LayoutCommand
{
public:
    using Edit = std::function<bool(LotLayoutState &, Error *)>;

    SnapshotCommand(LotLayoutState &state, QString text, Edit edit)
        : m_state(state)
        , m_text(std::move(text))
        , m_edit(std::move(edit))
    {
    }

    QString text() const override { return m_text; }

    bool apply(Error *error) override
    {
        LotLayoutState before = m_state;
        if (!m_edit(m_state, error)) {
            m_state = std::move(before);
            return false;
        }
        m_before = std::move(before);
        return true;
    }

    void revert() override { m_state = m_before; }

private:
    LotLayoutState &m_state;
    QString m_text;
    Edit m_edit;
    LotLayoutState m_before;
};

} // namespace

LotEditor::LotEditor(std::size_t historyLimit)
    : m_history(historyLimit)
{
}

bool LotEditor::create(const QString &name, int rows, int cols, Error *error)
{
    auto registry = engine::SpaceRegistry::create(rows, cols, error);
    if (!registry) {
        return false;
    }
    m_lotId = QUuid::createUuid();
    m_name = name;
    m_state = LotLayoutState{rows, cols, {}, std::move(*registry)};
    m_history.clear();
    return true;
}

bool LotEditor::load(const data::ParkingLot &lot, Error *error)
{
    auto registry = engine::SpaceRegistry::fromSpaces(lot.rows, lot.cols, lot.spaces, error);
    if (!registry) {
        return false;
    }
    const QSet<int> merged = engine::LotGeometry::clampMergedAisles(lot.mergedAisles, lot.rows);
    if (merged.size() != lot.mergedAisles.size()) {
        qCWarning(lcCore) << "lot" << lot.name << "listed merged aisles that do not exist";
    }
    m_lotId = lot.id;
    m_name = lot.name;
    m_state = LotLayoutState{lot.rows, lot.cols, merged, std::move(*registry)};
    m_history.clear();
    return true;
}

bool LotEditor::resize(int rows, int cols, Error *error)
{
    if (rows == m_state.rows && cols == m_state.cols) {
        return true;
    }
    const QString text = QObject::tr("Resize to %1 x %2").arg(rows).arg(cols);
    return m_history.execute(std::make_unique<SnapshotCommand>(
                                 m_state, text,
                                 [rows, cols](LotLayoutState &state, Error *err) {
                                     if (!state.registry.resize(rows, cols, err)) {
                                         return false;
                                     }
                                     state.rows = rows;
                                     state.cols = cols;
                                     state.mergedAisles = engine::LotGeometry::clampMergedAisles(state.mergedAisles, rows);
                                     return true;
                                 }),
                             error);
}

bool LotEditor::mergeRows(int first, int second, Error *error)
{
    const auto aisle = engine::LotGeometry::validateMerge(m_state.rows, first, second, error);
    if (!aisle) {
        return false;
    }
    return applyMerge(*aisle, QObject::tr("Merge rows %1 and %2").arg(first).arg(second), error);
}

bool LotEditor::mergeRows(const QString &first, const QString &second, Error *error)
{
    const auto aisle = engine::LotGeometry::validateMerge(m_state.rows, first, second, error);
    if (!aisle) {
        return false;
    }
    return applyMerge(*aisle, QObject::tr("Merge rows %1 and %2").arg(first.trimmed(), second.trimmed()), error);
}

bool LotEditor::resetMerges()
{
    if (m_state.mergedAisles.isEmpty()) {
        return true;
    }
    return m_history.execute(std::make_unique<SnapshotCommand>(m_state, QObject::tr("Reset merged rows"),
                                                               [](LotLayoutState &state, Error *) {
                                                                   state.mergedAisles.clear();
                                                                   return true;
                                                               }));
}

bool LotEditor::setSpaceType(int spaceId, data::SpaceType type, Error *error)
{
    const auto space = m_state.registry.spaceById(spaceId);
    if (!space) {
        reportError(error, ErrorCode::Validation, QObject::tr("Space %1 does not exist.").arg(spaceId));
        return false;
    }
    if (space->type == type) {
        return true;
    }
    const QString text = QObject::tr("Mark space %1 as %2").arg(spaceId).arg(data::spaceTypeToString(type));
    return m_history.execute(std::make_unique<SnapshotCommand>(m_state, text,
                                                               [spaceId, type](LotLayoutState &state, Error *) {
                                                                   return state.registry.setTypeById(spaceId, type);
                                                               }),
                             error);
}

void LotEditor::rename(const QString &name)
{
    m_name = name;
}

bool LotEditor::undo()
{
    return m_history.undo();
}

bool LotEditor::redo()
{
    return m_history.redo();
}

bool LotEditor::canUndo() const
{
    return m_history.canUndo();
}

bool LotEditor::canRedo() const
{
    return m_history.canRedo();
}

const LayoutHistory &LotEditor::history() const
{
    return m_history;
}

data::ParkingLot LotEditor::lot() const
{
    data::ParkingLot lot;
    lot.id = m_lotId;
    lot.name = m_name;
    lot.rows = m_state.rows;
    lot.cols = m_state.cols;
    lot.spaces = m_state.registry.spaces();
    lot.mergedAisles = m_state.mergedAisles;
    return lot;
}

engine::LotGeometry LotEditor::geometry() const
{
    return engine::LotGeometry(m_state.rows, m_state.cols, m_state.mergedAisles);
}

bool LotEditor::applyMerge(int aisle, const QString &text, Error *error)
{
    if (m_state.mergedAisles.contains(aisle)) {
        return true;
    }
    return m_history.execute(std::make_unique<SnapshotCommand>(m_state, text,
                                                               [aisle](LotLayoutState &state, Error *) {
                                                                   state.mergedAisles.insert(aisle);
                                                                   return true;
                                                               }),
                             error);
}

} // namespace core
} // namespace parking
