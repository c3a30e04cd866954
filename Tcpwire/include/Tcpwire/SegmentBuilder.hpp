#ifndef TCPWIRE_SEGMENTBUILDER_HPP
#define TCPWIRE_SEGMENTBUILDER_HPP

#include <stddef.h>
#include <stdint.h>
#include <Tcpwire/ChecksumCalc.hpp>
#include <Tcpwire/ErrorCode.hpp>
#include <Tcpwire/Header.hpp>
#include <Tcpwire/Options.hpp>

//Assembles header, options and payload into a caller buffer and patches
//the checksum in. The buffer is borrowed for the builder's lifetime.
class SegmentBuilder
{
public:
    SegmentBuilder(uint8_t *buffer, size_t capacity);

    //The data offset and the pseudo-header's TCP length are taken from the
    //assembled segment, whatever the caller put in them.
    ErrorCode build(const PseudoHeader &psd,
                    const TcpHeaderFields &fields,
                    const TcpOption *options, size_t count,
                    const void *payload, size_t len);

    const uint8_t *data() const;

    //0 until a build succeeds
    size_t size() const;

private:
    uint8_t *buffer_;
    size_t capacity_;
    size_t size_;
};

#endif
