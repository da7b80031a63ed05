#pragma once

#include <QString>

#include "parking/core/Error.hpp"

namespace parking {
namespace core {

class LayoutCommand
{
public:
    virtual ~LayoutCommand() = default;

    virtual QString text() const = 0;
    // Returns false, leaving the layout untouched, when the edit is rejected.
    virtual bool apply(Error *error) = 0;
    virtual void revert() = 0;
};

} // namespace core
} // namespace parking
