#ifndef TCPWIRE_HEADER_HPP
#define TCPWIRE_HEADER_HPP

#include <stddef.h>
#include <stdint.h>
#include <Tcpwire/ErrorCode.hpp>

constexpr const size_t TCP_HEADER_LEN = 20;

constexpr const size_t TCP_MAX_HEADER_LEN = 60;

//data offset bounds, in 32-bit words
constexpr const uint8_t TCP_MIN_DATA_OFFSET = 5;
constexpr const uint8_t TCP_MAX_DATA_OFFSET = 15;

//Control bits, byte 13 of the header. RFC 9293 section 6
//CWR is bit 7 down to FIN at bit 0.
struct TcpFlags{
    bool cwr;
    bool ece;
    bool urg;
    bool ack;
    bool psh;
    bool rst;
    bool syn;
    bool fin;

    uint8_t toByte() const;

    static TcpFlags fromByte(uint8_t value);
};

bool operator==(const TcpFlags &lhs, const TcpFlags &rhs);

struct TcpHeaderFields{
    uint16_t sport;
    uint16_t dport;
    uint32_t seq;
    //only meaningful with ACK set, kept bit-exact regardless
    uint32_t ackSeq;
    //in words. 0 on encode means derive it from the options length
    uint8_t dataOffset;
    //written as zero, decoded as zero
    uint8_t reserved;
    TcpFlags flags;
    uint16_t wnd;
    //ignored on encode, the on-wire value on decode
    uint16_t check;
    uint16_t urgPtr;

    //data offset 5, everything else zero
    static TcpHeaderFields make(uint16_t sport, uint16_t dport);
};

bool operator==(const TcpHeaderFields &lhs, const TcpHeaderFields &rhs);

class HeaderCodec
{
public:
    //Writes the fixed 20 bytes for a header followed by optionsLen bytes of
    //options, checksum field zero.
    static ErrorCode encode(const TcpHeaderFields &fields, size_t optionsLen,
                            uint8_t *out, size_t capacity);

    //Options start at data + 20, the payload at data + headerLen.
    //The checksum is not looked at.
    static ErrorCode decode(const uint8_t *data, size_t len,
                            TcpHeaderFields &fields, size_t &headerLen);
};

#endif
