#include <Tcpwire/Trace.hpp>
#include <Tcpwire/ChecksumCalc.hpp>
#include <Tcpwire/Header.hpp>
#include <Tcpwire/Options.hpp>
#include <Tcpwire/Segment.hpp>
#include <arpa/inet.h>
#include <chrono>
#include <stdio.h>
#include <string.h>
#include <sys/socket.h>
#include <time.h>

std::string addrToString(uint32_t addr)
{
    std::string str;
    uint8_t *start = (uint8_t *)&addr;
    for (int i = 0; i < 4; i++)
    {
        str += std::to_string(start[i]);
        if (i < 3)
        {
            str += '.';
        }
    }
    return str;
}

static std::string inetToString(PseudoHeader::Family family, const uint8_t *addr)
{
    if (family == PseudoHeader::Family::IPV4)
    {
        uint32_t v4;
        memcpy(&v4, addr, sizeof(v4));
        return addrToString(v4);
    }
    char buf[INET6_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET6, addr, buf, sizeof(buf)) == nullptr)
    {
        return "?";
    }
    return buf;
}

std::string srcAddrToString(const PseudoHeader &psd)
{
    return inetToString(psd.family, psd.saddr);
}

std::string dstAddrToString(const PseudoHeader &psd)
{
    return inetToString(psd.family, psd.daddr);
}

std::string flagsToString(const TcpFlags &flags)
{
    std::string str;
    if (flags.urg)
        str += 'U';
    if (flags.ack)
        str += '.';
    if (flags.psh)
        str += 'P';
    if (flags.rst)
        str += 'R';
    if (flags.syn)
        str += 'S';
    if (flags.fin)
        str += 'F';
    if (flags.ece)
        str += 'E';
    if (flags.cwr)
        str += 'C';
    return str;
}

std::string optionsToString(const OptionsReader &options)
{
    OptionsReader reader = options;
    reader.reset();
    std::string str;
    TcpOption opt;
    ErrorCode code = ErrorCode::OK;
    while (reader.next(opt, code))
    {
        if (!str.empty())
        {
            str += ',';
        }
        switch (opt.type)
        {
        case TcpOptionType::END_OF_LIST:
            str += "eol";
            break;
        case TcpOptionType::NO_OPERATION:
            str += "nop";
            break;
        case TcpOptionType::MAXIMUM_SEGMENT_SIZE:
            str += "mss " + std::to_string(opt.mss);
            break;
        case TcpOptionType::UNKNOWN:
            str += "opt-" + std::to_string(opt.kind()) + " len " + std::to_string(opt.encodedLength());
            break;
        }
    }
    if (code != ErrorCode::OK)
    {
        if (!str.empty())
        {
            str += ',';
        }
        str += errorString(code);
    }
    return str;
}

std::string formatSegment(const std::string &prefix, const PseudoHeader &psd,
                          const Segment &seg)
{
    std::string str = prefix + " " +
                      srcAddrToString(psd) + ":" + std::to_string(seg.sport()) + " > " +
                      dstAddrToString(psd) + ":" + std::to_string(seg.dport()) +
                      " seq " + std::to_string(seg.seq()) +
                      ", ack " + std::to_string(seg.ackSeq()) +
                      " win " + std::to_string(seg.wnd()) +
                      "[" + flagsToString(seg.fields().flags) + "]";
    OptionsReader options = seg.options();
    if (options.size() > 0)
    {
        str += " options [" + optionsToString(options) + "]";
    }
    str += " length " + std::to_string(seg.dataLen());
    return str;
}

void printSegmentInfo(const std::string &prefix, const PseudoHeader &psd,
                      const Segment &seg)
{
    time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tmv;
    char stamp[32] = {0};
    if (localtime_r(&tt, &tmv) != nullptr)
    {
        strftime(stamp, sizeof(stamp), "%a %b %d %H:%M:%S %Y", &tmv);
    }
    printf("[%s] %s\n", stamp, formatSegment(prefix, psd, seg).c_str());
}
