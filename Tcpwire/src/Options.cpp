#include <Tcpwire/Options.hpp>
#include <netinet/tcp.h>
#include <string.h>

TcpOption TcpOption::endOfList()
{
    TcpOption opt = {TcpOptionType::END_OF_LIST, TCPOPT_EOL, 0, nullptr, 0};
    return opt;
}

TcpOption TcpOption::noOperation()
{
    TcpOption opt = {TcpOptionType::NO_OPERATION, TCPOPT_NOP, 0, nullptr, 0};
    return opt;
}

TcpOption TcpOption::maximumSegmentSize(uint16_t mss)
{
    TcpOption opt = {TcpOptionType::MAXIMUM_SEGMENT_SIZE, TCPOPT_MAXSEG, mss, nullptr, 0};
    return opt;
}

TcpOption TcpOption::unknown(uint8_t kind, const uint8_t *data, size_t len)
{
    TcpOption opt = {TcpOptionType::UNKNOWN, kind, 0, data, len};
    return opt;
}

uint8_t TcpOption::kind() const
{
    return kindByte;
}

size_t TcpOption::encodedLength() const
{
    switch (type)
    {
    case TcpOptionType::END_OF_LIST:
    case TcpOptionType::NO_OPERATION:
        return 1;
    case TcpOptionType::MAXIMUM_SEGMENT_SIZE:
        return TCPOLEN_MAXSEG;
    case TcpOptionType::UNKNOWN:
        return 2 + dataLen;
    }
    return 0;
}

bool operator==(const TcpOption &lhs, const TcpOption &rhs)
{
    if (lhs.type != rhs.type || lhs.kindByte != rhs.kindByte)
    {
        return false;
    }
    if (lhs.type == TcpOptionType::MAXIMUM_SEGMENT_SIZE)
    {
        return lhs.mss == rhs.mss;
    }
    if (lhs.type == TcpOptionType::UNKNOWN)
    {
        if (lhs.dataLen != rhs.dataLen)
        {
            return false;
        }
        return lhs.dataLen == 0 || memcmp(lhs.data, rhs.data, lhs.dataLen) == 0;
    }
    return true;
}

size_t OptionsCodec::encodedLength(const TcpOption *options, size_t count)
{
    size_t total = 0;
    for (size_t i = 0; i < count; ++i)
    {
        total += options[i].encodedLength();
        if (options[i].type == TcpOptionType::END_OF_LIST)
        {
            break;
        }
    }
    return total;
}

size_t OptionsCodec::wordsNeeded(const TcpOption *options, size_t count)
{
    return (encodedLength(options, count) + 3) / 4;
}

ErrorCode OptionsCodec::encode(const TcpOption *options, size_t count,
                               uint8_t *out, size_t capacity, size_t &written)
{
    written = 0;
    for (size_t i = 0; i < count; ++i)
    {
        const TcpOption &opt = options[i];
        if (opt.type == TcpOptionType::END_OF_LIST)
        {
            break;
        }
        if (opt.encodedLength() > TCP_MAX_OPTION_LEN)
        {
            return ErrorCode::OPTION_TOO_LONG;
        }
        //would read back as EOL or NOP
        if (opt.type == TcpOptionType::UNKNOWN &&
            (opt.kindByte == TCPOPT_EOL || opt.kindByte == TCPOPT_NOP))
        {
            return ErrorCode::MALFORMED_OPTION;
        }
    }

    size_t padded = wordsNeeded(options, count) * 4;
    if (padded > TCP_MAX_OPTIONS_LEN)
    {
        return ErrorCode::OPTIONS_TOO_LONG;
    }
    if (padded > capacity)
    {
        return ErrorCode::BUFFER_TOO_SMALL;
    }

    uint8_t *opt = out;
    for (size_t i = 0; i < count; ++i)
    {
        const TcpOption &to = options[i];
        if (TcpOptionType::END_OF_LIST == to.type)
        {
            *opt++ = TCPOPT_EOL;
            break;
        }
        else if (TcpOptionType::NO_OPERATION == to.type)
        {
            *opt++ = TCPOPT_NOP;
        }
        else if (TcpOptionType::MAXIMUM_SEGMENT_SIZE == to.type)
        {
            *opt++ = TCPOPT_MAXSEG;
            *opt++ = TCPOLEN_MAXSEG;
            *opt++ = (uint8_t)(to.mss >> 8);
            *opt++ = (uint8_t)to.mss;
        }
        else
        {
            *opt++ = to.kindByte;
            *opt++ = (uint8_t)(2 + to.dataLen);
            if (to.dataLen > 0)
            {
                memcpy(opt, to.data, to.dataLen);
                opt += to.dataLen;
            }
        }
    }

    //zero padding reads back as EOL
    size_t used = opt - out;
    if (padded > used)
    {
        memset(opt, 0, padded - used);
    }
    written = padded;
    return ErrorCode::OK;
}

ErrorCode OptionsCodec::decode(const uint8_t *data, size_t len,
                               TcpOption *options, size_t maxCount, size_t &count)
{
    count = 0;
    OptionsReader reader(data, len);
    TcpOption opt;
    ErrorCode code = ErrorCode::OK;
    while (reader.next(opt, code))
    {
        if (count == maxCount)
        {
            return ErrorCode::BUFFER_TOO_SMALL;
        }
        options[count++] = opt;
    }
    return code;
}

OptionsReader::OptionsReader()
:data_(nullptr), len_(0), pos_(0), done_(false)
{
}

OptionsReader::OptionsReader(const uint8_t *data, size_t len)
:data_(data), len_(len), pos_(0), done_(false)
{
}

bool OptionsReader::next(TcpOption &option, ErrorCode &code)
{
    code = ErrorCode::OK;
    if (done_ || pos_ >= len_)
    {
        return false;
    }

    uint8_t kind = data_[pos_];
    if (TCPOPT_EOL == kind)
    {
        option = TcpOption::endOfList();
        pos_++;
        done_ = true;
        return true;
    }
    if (TCPOPT_NOP == kind)
    {
        option = TcpOption::noOperation();
        pos_++;
        return true;
    }

    size_t remaining = len_ - pos_;
    if (remaining < 2)
    {
        //kind byte without its length
        code = ErrorCode::MALFORMED_OPTION;
        done_ = true;
        return false;
    }
    uint8_t optLen = data_[pos_ + 1];
    if (optLen < 2 || optLen > remaining)
    {
        code = ErrorCode::MALFORMED_OPTION;
        done_ = true;
        return false;
    }

    const uint8_t *opt = data_ + pos_;
    if (TCPOPT_MAXSEG == kind && TCPOLEN_MAXSEG == optLen)
    {
        option = TcpOption::maximumSegmentSize((uint16_t)((opt[2] << 8) | opt[3]));
    }
    else
    {
        option = TcpOption::unknown(kind, opt + 2, optLen - 2);
    }
    pos_ += optLen;
    return true;
}

void OptionsReader::reset()
{
    pos_ = 0;
    done_ = false;
}

ErrorCode OptionsReader::validate() const
{
    OptionsReader walker(data_, len_);
    TcpOption opt;
    ErrorCode code = ErrorCode::OK;
    while (walker.next(opt, code))
    {
    }
    return code;
}

size_t OptionsReader::count() const
{
    OptionsReader walker(data_, len_);
    TcpOption opt;
    ErrorCode code = ErrorCode::OK;
    size_t n = 0;
    while (walker.next(opt, code))
    {
        n++;
    }
    return n;
}

const uint8_t *OptionsReader::data() const
{
    return data_;
}

size_t OptionsReader::size() const
{
    return len_;
}
