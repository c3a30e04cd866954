#include <Tcpwire/SegmentBuilder.hpp>
#include <arpa/inet.h>
#include <string.h>

SegmentBuilder::SegmentBuilder(uint8_t *buffer, size_t capacity)
:buffer_(buffer), capacity_(capacity), size_(0)
{
}

ErrorCode SegmentBuilder::build(const PseudoHeader &psd,
                                const TcpHeaderFields &fields,
                                const TcpOption *options, size_t count,
                                const void *payload, size_t len)
{
    size_ = 0;
    size_t optCapacity = capacity_ > TCP_HEADER_LEN ? capacity_ - TCP_HEADER_LEN : 0;
    size_t optLen = 0;
    ErrorCode code = OptionsCodec::encode(options, count,
                                          buffer_ + TCP_HEADER_LEN, optCapacity, optLen);
    if (code != ErrorCode::OK)
    {
        return code;
    }

    //data offset follows the options actually written
    TcpHeaderFields hdr = fields;
    hdr.dataOffset = 0;
    code = HeaderCodec::encode(hdr, optLen, buffer_, capacity_);
    if (code != ErrorCode::OK)
    {
        return code;
    }

    size_t hdrLen = TCP_HEADER_LEN + optLen;
    if (len > capacity_ - hdrLen)
    {
        return ErrorCode::BUFFER_TOO_SMALL;
    }
    uint8_t *data = buffer_ + hdrLen;
    if (len > 0)
    {
        memmove(data, payload, len);
    }
    size_t total = hdrLen + len;
    //IPv4 pseudo-header carries a 16-bit TCP length
    if (psd.family == PseudoHeader::Family::IPV4 && total > 0xffff)
    {
        return ErrorCode::BUFFER_TOO_SMALL;
    }

    PseudoHeader psdh = psd;
    psdh.tcpLen = (uint32_t)total;
    uint16_t check = calcTcpChecksum(psdh, buffer_, TCP_HEADER_LEN,
                                     buffer_ + TCP_HEADER_LEN, optLen, data, len);
    uint16_t netCheck = htons(check);
    memcpy(buffer_ + 16, &netCheck, sizeof(netCheck));

    size_ = total;
    return ErrorCode::OK;
}

const uint8_t *SegmentBuilder::data() const
{
    return buffer_;
}

size_t SegmentBuilder::size() const
{
    return size_;
}
