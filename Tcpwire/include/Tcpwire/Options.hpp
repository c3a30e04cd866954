#ifndef TCPWIRE_OPTIONS_HPP
#define TCPWIRE_OPTIONS_HPP

#include <stddef.h>
#include <stdint.h>
#include <Tcpwire/ErrorCode.hpp>

//room left by a 15 word data offset
constexpr const size_t TCP_MAX_OPTIONS_LEN = 40;

//8-bit length field
constexpr const size_t TCP_MAX_OPTION_LEN = 255;

enum class TcpOptionType{
    END_OF_LIST,
    NO_OPERATION,
    MAXIMUM_SEGMENT_SIZE,
    UNKNOWN
};

struct TcpOption{
    TcpOptionType type;
    //kind byte as carried on the wire
    uint8_t kindByte;
    uint16_t mss;
    //payload of an unknown option, borrowed, not owned
    const uint8_t *data;
    size_t dataLen;

    static TcpOption endOfList();
    static TcpOption noOperation();
    static TcpOption maximumSegmentSize(uint16_t mss);
    static TcpOption unknown(uint8_t kind, const uint8_t *data, size_t len);

    uint8_t kind() const;

    //kind and length bytes included
    size_t encodedLength() const;
};

bool operator==(const TcpOption &lhs, const TcpOption &rhs);

inline bool operator!=(const TcpOption &lhs, const TcpOption &rhs)
{
    return !(lhs == rhs);
}

class OptionsCodec
{
public:
    //Unpadded length. Options after an END_OF_LIST are not counted.
    static size_t encodedLength(const TcpOption *options, size_t count);

    //32-bit words needed once padded
    static size_t wordsNeeded(const TcpOption *options, size_t count);

    //Writes the options padded with zeros to a 4 byte boundary.
    static ErrorCode encode(const TcpOption *options, size_t count,
                            uint8_t *out, size_t capacity, size_t &written);

    //Eager decode into a caller array, see OptionsReader.
    static ErrorCode decode(const uint8_t *data, size_t len,
                            TcpOption *options, size_t maxCount, size_t &count);
};

//Walks an options area without copying it. Stops after END_OF_LIST
//or at the end of the area, reset() starts over.
class OptionsReader
{
public:
    OptionsReader();
    OptionsReader(const uint8_t *data, size_t len);

    //false at the end of the options or on error, code tells which
    bool next(TcpOption &option, ErrorCode &code);

    void reset();

    //walks the whole area, the cursor is left alone
    ErrorCode validate() const;

    //options before the first error
    size_t count() const;

    const uint8_t *data() const;
    size_t size() const;

private:
    const uint8_t *data_;
    size_t len_;
    size_t pos_;
    bool done_;
};

#endif
