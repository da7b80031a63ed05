#include "parking/core/LayoutHistory.hpp"

#include "parking/core/LayoutCommand.hpp"
#include "parking/core/Logging.hpp"

#include <QObject>

namespace parking {
namespace core {

LayoutHistory::LayoutHistory(std::size_t limit)
    : m_limit(limit > 0 ? limit : 1)
{
}

LayoutHistory::~LayoutHistory() = default;

bool LayoutHistory::execute(std::unique_ptr<LayoutCommand> command, Error *error)
{
    if (!command) {
        reportError(error, ErrorCode::Validation, QObject::tr("No layout change given."));
        return false;
    }
    if (!command->apply(error)) {
        qCDebug(lcCore) << "layout edit rejected:" << command->text();
        return false;
    }

    // A new edit discards everything that could have been redone.
    if (m_index < m_commands.size()) {
        m_commands.erase(m_commands.begin() + static_cast<long>(m_index), m_commands.end());
    }
    if (m_commands.size() == m_limit) {
        m_commands.erase(m_commands.begin());
    }
    m_commands.push_back(std::move(command));
    m_index = m_commands.size();
    return true;
}

bool LayoutHistory::canUndo() const
{
    return m_index > 0;
}

bool LayoutHistory::canRedo() const
{
    return m_index < m_commands.size();
}

bool LayoutHistory::undo()
{
    if (!canUndo()) {
        return false;
    }
    m_commands[m_index - 1]->revert();
    --m_index;
    return true;
}

bool LayoutHistory::redo()
{
    if (!canRedo()) {
        return false;
    }
    Error error;
    if (!m_commands[m_index]->apply(&error)) {
        qCWarning(lcCore) << "redo of" << m_commands[m_index]->text() << "failed:" << error.message;
        return false;
    }
    ++m_index;
    return true;
}

void LayoutHistory::clear()
{
    m_commands.clear();
    m_index = 0;
}

std::size_t LayoutHistory::count() const
{
    return m_commands.size();
}

std::size_t LayoutHistory::limit() const
{
    return m_limit;
}

QString LayoutHistory::undoText() const
{
    return canUndo() ? m_commands[m_index - 1]->text() : QString();
}

QString LayoutHistory::redoText() const
{
    return canRedo() ? m_commands[m_index]->text() : QString();
}

} // namespace core
} // namespace parking
