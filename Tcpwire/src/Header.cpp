#include <Tcpwire/Header.hpp>
#include <Tcpwire/Options.hpp>
#include <arpa/inet.h>
#include <string.h>

static void putU16(uint8_t *ptr, uint16_t value)
{
    uint16_t net = htons(value);
    memcpy(ptr, &net, sizeof(net));
}

static void putU32(uint8_t *ptr, uint32_t value)
{
    uint32_t net = htonl(value);
    memcpy(ptr, &net, sizeof(net));
}

static uint16_t getU16(const uint8_t *ptr)
{
    uint16_t net;
    memcpy(&net, ptr, sizeof(net));
    return ntohs(net);
}

static uint32_t getU32(const uint8_t *ptr)
{
    uint32_t net;
    memcpy(&net, ptr, sizeof(net));
    return ntohl(net);
}

uint8_t TcpFlags::toByte() const
{
    uint8_t value = 0;
    if (fin)
        value |= 0x01;
    if (syn)
        value |= 0x02;
    if (rst)
        value |= 0x04;
    if (psh)
        value |= 0x08;
    if (ack)
        value |= 0x10;
    if (urg)
        value |= 0x20;
    if (ece)
        value |= 0x40;
    if (cwr)
        value |= 0x80;
    return value;
}

TcpFlags TcpFlags::fromByte(uint8_t value)
{
    TcpFlags flags;
    flags.cwr = (value & 0x80) != 0;
    flags.ece = (value & 0x40) != 0;
    flags.urg = (value & 0x20) != 0;
    flags.ack = (value & 0x10) != 0;
    flags.psh = (value & 0x08) != 0;
    flags.rst = (value & 0x04) != 0;
    flags.syn = (value & 0x02) != 0;
    flags.fin = (value & 0x01) != 0;
    return flags;
}

bool operator==(const TcpFlags &lhs, const TcpFlags &rhs)
{
    return lhs.toByte() == rhs.toByte();
}

TcpHeaderFields TcpHeaderFields::make(uint16_t sport, uint16_t dport)
{
    TcpHeaderFields fields;
    memset(&fields, 0, sizeof(fields));
    fields.sport = sport;
    fields.dport = dport;
    fields.dataOffset = TCP_MIN_DATA_OFFSET;
    return fields;
}

bool operator==(const TcpHeaderFields &lhs, const TcpHeaderFields &rhs)
{
    return  lhs.sport == rhs.sport &&
            lhs.dport == rhs.dport &&
            lhs.seq == rhs.seq &&
            lhs.ackSeq == rhs.ackSeq &&
            lhs.dataOffset == rhs.dataOffset &&
            lhs.reserved == rhs.reserved &&
            lhs.flags == rhs.flags &&
            lhs.wnd == rhs.wnd &&
            lhs.check == rhs.check &&
            lhs.urgPtr == rhs.urgPtr;
}

ErrorCode HeaderCodec::encode(const TcpHeaderFields &fields, size_t optionsLen,
                              uint8_t *out, size_t capacity)
{
    if (optionsLen % 4 != 0)
    {
        return ErrorCode::INVALID_DATA_OFFSET;
    }
    if (optionsLen > TCP_MAX_OPTIONS_LEN)
    {
        return ErrorCode::OPTIONS_TOO_LONG;
    }
    uint8_t doff = (uint8_t)(TCP_MIN_DATA_OFFSET + optionsLen / 4);
    if (fields.dataOffset != 0 && fields.dataOffset != doff)
    {
        return ErrorCode::INVALID_DATA_OFFSET;
    }
    if (capacity < TCP_HEADER_LEN)
    {
        return ErrorCode::BUFFER_TOO_SMALL;
    }

    putU16(out, fields.sport);
    putU16(out + 2, fields.dport);
    putU32(out + 4, fields.seq);
    putU32(out + 8, fields.ackSeq);
    //data offset in the high nibble, reserved bits zero
    out[12] = (uint8_t)(doff << 4);
    out[13] = fields.flags.toByte();
    putU16(out + 14, fields.wnd);
    putU16(out + 16, 0);
    putU16(out + 18, fields.urgPtr);
    return ErrorCode::OK;
}

ErrorCode HeaderCodec::decode(const uint8_t *data, size_t len,
                              TcpHeaderFields &fields, size_t &headerLen)
{
    headerLen = 0;
    if (len < TCP_HEADER_LEN)
    {
        return ErrorCode::TOO_SHORT;
    }

    uint8_t doff = data[12] >> 4;
    if (doff < TCP_MIN_DATA_OFFSET)
    {
        return ErrorCode::INVALID_DATA_OFFSET;
    }
    if ((size_t)doff * 4 > len)
    {
        return ErrorCode::TOO_SHORT;
    }

    fields.sport = getU16(data);
    fields.dport = getU16(data + 2);
    fields.seq = getU32(data + 4);
    fields.ackSeq = getU32(data + 8);
    fields.dataOffset = doff;
    fields.reserved = 0;
    fields.flags = TcpFlags::fromByte(data[13]);
    fields.wnd = getU16(data + 14);
    fields.check = getU16(data + 16);
    fields.urgPtr = getU16(data + 18);
    headerLen = (size_t)doff * 4;
    return ErrorCode::OK;
}
