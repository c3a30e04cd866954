#include <Tcpwire/ChecksumCalc.hpp>
#include <Tcpwire/Segment.hpp>
#include <Tcpwire/SegmentBuilder.hpp>
#include <Tcpwire/Trace.hpp>
#include <arpa/inet.h>
#include <ctype.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include <sys/socket.h>
#include <vector>

void usage(const char *prog)
{
	printf("usage: %s                       build and dump a SYN with MSS\n", prog);
	printf("       %s <src> <dst> <hex>     parse a segment, src/dst IPv4 or IPv6\n", prog);
}

void dumpHex(const uint8_t *data, size_t len)
{
	for (size_t i = 0; i < len; ++i)
	{
		printf("%02x%s", data[i], (i % 16 == 15 || i + 1 == len) ? "\n" : " ");
	}
}

bool parseHex(const std::string &hex, std::vector<uint8_t> &out)
{
	std::string digits;
	for (char c : hex)
	{
		if (c == ' ' || c == ':')
		{
			continue;
		}
		if (!isxdigit((unsigned char)c))
		{
			return false;
		}
		digits += c;
	}
	if (digits.size() % 2 != 0)
	{
		return false;
	}
	for (size_t i = 0; i < digits.size(); i += 2)
	{
		unsigned int byte;
		if (sscanf(digits.c_str() + i, "%2x", &byte) != 1)
		{
			return false;
		}
		out.push_back((uint8_t)byte);
	}
	return true;
}

bool parsePseudoHeader(const char *src, const char *dst, uint32_t tcpLen, PseudoHeader &psd)
{
	uint8_t saddr[16], daddr[16];
	if (inet_pton(AF_INET, src, saddr) == 1 && inet_pton(AF_INET, dst, daddr) == 1)
	{
		psd = PseudoHeader::ipv4(saddr, daddr, (uint16_t)tcpLen);
		return true;
	}
	if (inet_pton(AF_INET6, src, saddr) == 1 && inet_pton(AF_INET6, dst, daddr) == 1)
	{
		psd = PseudoHeader::ipv6(saddr, daddr, tcpLen);
		return true;
	}
	return false;
}

int buildExample()
{
	uint8_t saddr[4] = {192, 168, 1, 100};
	uint8_t daddr[4] = {192, 168, 1, 1};
	PseudoHeader psd = PseudoHeader::ipv4(saddr, daddr, 0);

	TcpHeaderFields th = TcpHeaderFields::make(12345, 80);
	th.seq = 0x12345678;
	th.flags.syn = true;
	th.wnd = 65535;
	TcpOption opts[] = {TcpOption::maximumSegmentSize(1460)};

	uint8_t buffer[TCP_MAX_HEADER_LEN];
	SegmentBuilder sb(buffer, sizeof(buffer));
	ErrorCode code = sb.build(psd, th, opts, 1, nullptr, 0);
	if (code != ErrorCode::OK)
	{
		printf("build failed: %s\n", errorString(code));
		return 1;
	}
	dumpHex(sb.data(), sb.size());

	psd.tcpLen = (uint32_t)sb.size();
	Segment seg;
	code = parseSegment(psd, sb.data(), sb.size(), seg);
	if (code != ErrorCode::OK)
	{
		printf("parse failed: %s\n", errorString(code));
		return 1;
	}
	printSegmentInfo("Send", psd, seg);
	return 0;
}

int main(int argc, char *argv[])
{
	if (argc == 1)
	{
		return buildExample();
	}
	if (argc != 4)
	{
		usage(argv[0]);
		return 1;
	}

	std::vector<uint8_t> buffer;
	if (!parseHex(argv[3], buffer))
	{
		printf("bad hex: %s\n", argv[3]);
		return 1;
	}
	PseudoHeader psd;
	if (!parsePseudoHeader(argv[1], argv[2], (uint32_t)buffer.size(), psd))
	{
		printf("bad address pair: %s %s\n", argv[1], argv[2]);
		return 1;
	}

	Segment seg;
	ErrorCode code = parseSegment(psd, buffer.data(), buffer.size(), seg);
	if (code == ErrorCode::CHECKSUM_MISMATCH)
	{
		printSegmentInfo("Bad checksum", psd, seg);
		return 1;
	}
	if (code != ErrorCode::OK)
	{
		printf("parse failed: %s\n", errorString(code));
		return 1;
	}
	printSegmentInfo("Recv", psd, seg);
	return 0;
}
