#ifndef TCPWIRE_TRACE_HPP
#define TCPWIRE_TRACE_HPP

#include <stdint.h>
#include <string>

struct PseudoHeader;
struct TcpFlags;
class OptionsReader;
class Segment;

//dotted quad from a network order address
std::string addrToString(uint32_t addr);

std::string srcAddrToString(const PseudoHeader &psd);
std::string dstAddrToString(const PseudoHeader &psd);

//tcpdump style: U . P R S F, then E and C for ECE and CWR
std::string flagsToString(const TcpFlags &flags);

//"mss 1460,nop,eol"
std::string optionsToString(const OptionsReader &options);

//"prefix 10.0.0.1:999 > 10.0.0.2:80 seq 1, ack 0 win 65535[S] length 0"
std::string formatSegment(const std::string &prefix, const PseudoHeader &psd,
                          const Segment &seg);

//formatSegment with a timestamp, to stdout
void printSegmentInfo(const std::string &prefix, const PseudoHeader &psd,
                      const Segment &seg);

#endif
