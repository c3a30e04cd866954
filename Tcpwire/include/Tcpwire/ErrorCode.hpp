#ifndef TCPWIRE_ERRORCODE_HPP
#define TCPWIRE_ERRORCODE_HPP

#include <ostream>

enum class ErrorCode{
    OK,
    //buffer smaller than the minimum header or than the declared data offset
    TOO_SHORT,
    INVALID_DATA_OFFSET,
    //options area would not fit in a 15 word header
    OPTIONS_TOO_LONG,
    //single option longer than its 8-bit length field allows
    OPTION_TOO_LONG,
    MALFORMED_OPTION,
    CHECKSUM_MISMATCH,
    //caller supplied output buffer cannot hold the result
    BUFFER_TOO_SMALL
};

const char *errorString(ErrorCode code);

inline std::ostream& operator<<(std::ostream &os, ErrorCode code)
{
    return os << errorString(code);
}

#endif
