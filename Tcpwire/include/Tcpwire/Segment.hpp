#ifndef TCPWIRE_SEGMENT_HPP
#define TCPWIRE_SEGMENT_HPP

#include <stddef.h>
#include <stdint.h>
#include <Tcpwire/ChecksumCalc.hpp>
#include <Tcpwire/ErrorCode.hpp>
#include <Tcpwire/Header.hpp>
#include <Tcpwire/Options.hpp>

class Segment;

//Header and options decode, no checksum check.
ErrorCode decodeSegment(const uint8_t *buffer, size_t len, Segment &segment);

//Header decode, checksum verify, then options. On CHECKSUM_MISMATCH the
//segment is still filled in so it can be logged.
ErrorCode parseSegment(const PseudoHeader &psd, const uint8_t *buffer, size_t len,
                       Segment &segment);

//Decoded view over a caller buffer. Valid as long as the buffer is.
class Segment
{
public:
    Segment();

    const TcpHeaderFields &fields() const;

    uint16_t sport() const;
    uint16_t dport() const;
    uint32_t seq() const;
    uint32_t ackSeq() const;
    //words
    uint8_t dataOffset() const;
    //bytes, header plus options
    size_t headerLen() const;
    bool cwr() const;
    bool ece() const;
    bool urg() const;
    bool ack() const;
    bool psh() const;
    bool rst() const;
    bool syn() const;
    bool fin() const;
    uint16_t wnd() const;
    uint16_t check() const;
    uint16_t urgPtr() const;

    OptionsReader options() const;

    const uint8_t *data() const;
    size_t dataLen() const;

    const uint8_t *rawData() const;
    size_t rawLen() const;

private:
    friend ErrorCode decodeSegment(const uint8_t *buffer, size_t len, Segment &segment);
    friend ErrorCode parseSegment(const PseudoHeader &psd, const uint8_t *buffer, size_t len,
                                  Segment &segment);

    static ErrorCode decodeHeader(const uint8_t *buffer, size_t len, Segment &segment);

    TcpHeaderFields fields_;
    const uint8_t *raw_;
    size_t len_;
    size_t headerLen_;
};

#endif
