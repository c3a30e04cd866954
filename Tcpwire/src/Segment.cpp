#include <Tcpwire/Segment.hpp>
#include <string.h>

ErrorCode Segment::decodeHeader(const uint8_t *buffer, size_t len, Segment &segment)
{
    TcpHeaderFields fields;
    size_t headerLen = 0;
    ErrorCode code = HeaderCodec::decode(buffer, len, fields, headerLen);
    if (code != ErrorCode::OK)
    {
        return code;
    }
    segment.fields_ = fields;
    segment.raw_ = buffer;
    segment.len_ = len;
    segment.headerLen_ = headerLen;
    return ErrorCode::OK;
}

ErrorCode decodeSegment(const uint8_t *buffer, size_t len, Segment &segment)
{
    ErrorCode code = Segment::decodeHeader(buffer, len, segment);
    if (code != ErrorCode::OK)
    {
        return code;
    }
    return segment.options().validate();
}

ErrorCode parseSegment(const PseudoHeader &psd, const uint8_t *buffer, size_t len,
                       Segment &segment)
{
    ErrorCode code = Segment::decodeHeader(buffer, len, segment);
    if (code != ErrorCode::OK)
    {
        return code;
    }
    if (!verifyTcpChecksum(psd, buffer, len))
    {
        return ErrorCode::CHECKSUM_MISMATCH;
    }
    return segment.options().validate();
}

Segment::Segment()
:raw_(nullptr), len_(0), headerLen_(0)
{
    memset(&fields_, 0, sizeof(fields_));
}

const TcpHeaderFields &Segment::fields() const
{
    return fields_;
}

uint16_t Segment::sport() const
{
    return fields_.sport;
}

uint16_t Segment::dport() const
{
    return fields_.dport;
}

uint32_t Segment::seq() const
{
    return fields_.seq;
}

uint32_t Segment::ackSeq() const
{
    return fields_.ackSeq;
}

uint8_t Segment::dataOffset() const
{
    return fields_.dataOffset;
}

size_t Segment::headerLen() const
{
    return headerLen_;
}

bool Segment::cwr() const
{
    return fields_.flags.cwr;
}

bool Segment::ece() const
{
    return fields_.flags.ece;
}

bool Segment::urg() const
{
    return fields_.flags.urg;
}

bool Segment::ack() const
{
    return fields_.flags.ack;
}

bool Segment::psh() const
{
    return fields_.flags.psh;
}

bool Segment::rst() const
{
    return fields_.flags.rst;
}

bool Segment::syn() const
{
    return fields_.flags.syn;
}

bool Segment::fin() const
{
    return fields_.flags.fin;
}

uint16_t Segment::wnd() const
{
    return fields_.wnd;
}

uint16_t Segment::check() const
{
    return fields_.check;
}

uint16_t Segment::urgPtr() const
{
    return fields_.urgPtr;
}

OptionsReader Segment::options() const
{
    if (raw_ == nullptr)
    {
        return OptionsReader();
    }
    return OptionsReader(raw_ + TCP_HEADER_LEN, headerLen_ - TCP_HEADER_LEN);
}

const uint8_t *Segment::data() const
{
    if (raw_ == nullptr)
    {
        return nullptr;
    }
    return raw_ + headerLen_;
}

size_t Segment::dataLen() const
{
    return len_ - headerLen_;
}

const uint8_t *Segment::rawData() const
{
    return raw_;
}

size_t Segment::rawLen() const
{
    return len_;
}
