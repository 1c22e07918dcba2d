#include "core/error.h"

namespace imagen
{
const char* ErrorCodeName(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::None: return "none";
        case ErrorCode::InsufficientDistinctColours: return "insufficient distinct colours";
        case ErrorCode::InvalidHueSelection: return "invalid hue selection";
        case ErrorCode::IncompleteAssignment: return "incomplete assignment";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::ImageLoadFailed: return "image load failed";
        case ErrorCode::TemplateFailed: return "template failed";
        case ErrorCode::WriteFailed: return "write failed";
        case ErrorCode::ConfigInvalid: return "config invalid";
    }
    return "unknown";
}
} // namespace imagen
