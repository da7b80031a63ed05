#pragma once

#include <QString>
#include <cstddef>
#include <memory>
#include <vector>

#include "parking/core/Error.hpp"

namespace parking {
namespace core {

class LayoutCommand;

class LayoutHistory
{
public:
    explicit LayoutHistory(std::size_t limit = 100);
    ~LayoutHistory();

    // Applies `command` and records it. Rejected commands are not recorded.
    bool execute(std::unique_ptr<LayoutCommand> command, Error *error = nullptr);
    bool canUndo() const;
    bool canRedo() const;
    bool undo();
    bool redo();
    void clear();
    std::size_t count() const;
    std::size_t limit() const;
    QString undoText() const;
    QString redoText() const;

private:
    std::vector<std::unique_ptr<LayoutCommand>> m_commands;
    std::size_t m_index = 0;
    std::size_t m_limit = 0;
};

} // namespace core
} // namespace parking
