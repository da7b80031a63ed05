#pragma once

#include <QString>

namespace parking {
namespace core {

enum class ErrorCode
{
    None,
    Validation,
    InconsistentState,
};

struct Error
{
    ErrorCode code = ErrorCode::None;
    QString message;

    bool isError() const { return code != ErrorCode::None; }
};

// Fills `error` when the caller asked for it.
inline void reportError(Error *error, ErrorCode code, const QString &message)
{
    if (error) {
        error->code = code;
        error->message = message;
    }
}

} // namespace core
} // namespace parking
