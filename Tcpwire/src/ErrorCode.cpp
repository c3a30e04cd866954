#include <Tcpwire/ErrorCode.hpp>

const char *errorString(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::OK:
        return "Success";
    case ErrorCode::TOO_SHORT:
        return "Segment too short";
    case ErrorCode::INVALID_DATA_OFFSET:
        return "Invalid data offset";
    case ErrorCode::OPTIONS_TOO_LONG:
        return "Options exceed 40 bytes";
    case ErrorCode::OPTION_TOO_LONG:
        return "Option exceeds 255 bytes";
    case ErrorCode::MALFORMED_OPTION:
        return "Malformed option";
    case ErrorCode::CHECKSUM_MISMATCH:
        return "Checksum mismatch";
    case ErrorCode::BUFFER_TOO_SMALL:
        return "Output buffer too small";
    }
    return "Unknown error";
}
