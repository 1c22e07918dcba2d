#pragma once

#include <cstdint>
#include <string>

namespace imagen
{
enum class ErrorCode : std::uint8_t
{
    None = 0,

    // Core
    InsufficientDistinctColours,
    InvalidHueSelection,
    IncompleteAssignment,

    // Collaborators
    InvalidArgument,
    ImageLoadFailed,
    TemplateFailed,
    WriteFailed,
    ConfigInvalid,
};

const char* ErrorCodeName(ErrorCode code);

struct Error
{
    ErrorCode   code = ErrorCode::None;
    std::string message;

    bool IsSet() const { return code != ErrorCode::None; }

    void Clear()
    {
        code = ErrorCode::None;
        message.clear();
    }

    // Convenience for `return err.Fail(...)` at failure sites.
    bool Fail(ErrorCode c, std::string msg)
    {
        code = c;
        message = std::move(msg);
        return false;
    }
};
} // namespace imagen
