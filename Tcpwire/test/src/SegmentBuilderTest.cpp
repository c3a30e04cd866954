#include <gtest/gtest.h>
#include <Tcpwire/ChecksumCalc.hpp>
#include <Tcpwire/SegmentBuilder.hpp>
#include <string.h>
#include <vector>

class SegmentBuilderTest : public testing::Test
{
public:
    PseudoHeader psd;
    uint8_t buffer[1500];

public:
    virtual void SetUp()
    {
        uint8_t saddr[4] = {192, 168, 1, 100};
        uint8_t daddr[4] = {192, 168, 1, 1};
        psd = PseudoHeader::ipv4(saddr, daddr, 0);
        memset(buffer, 0xaa, sizeof(buffer));
    }
};

TEST_F(SegmentBuilderTest, synWithMss)
{
    TcpHeaderFields th = TcpHeaderFields::make(12345, 80);
    th.seq = 0x12345678;
    th.flags.syn = true;
    th.wnd = 65535;
    TcpOption opts[] = {TcpOption::maximumSegmentSize(1460)};

    SegmentBuilder sb(buffer, sizeof(buffer));
    ASSERT_EQ(sb.build(psd, th, opts, 1, nullptr, 0), ErrorCode::OK);
    ASSERT_EQ(sb.size(), 24u);
    ASSERT_EQ(sb.data(), buffer);

    const uint8_t *seg = sb.data();
    ASSERT_EQ(seg[0], 0x30);
    ASSERT_EQ(seg[1], 0x39);
    ASSERT_EQ(seg[2], 0x00);
    ASSERT_EQ(seg[3], 0x50);
    ASSERT_EQ(seg[12], 0x60);
    ASSERT_EQ(seg[13], 0x02);
    ASSERT_EQ(seg[16], 0x7b);
    ASSERT_EQ(seg[17], 0x3b);
    ASSERT_EQ(seg[20], 0x02);
    ASSERT_EQ(seg[21], 0x04);
    ASSERT_EQ(seg[22], 0x05);
    ASSERT_EQ(seg[23], 0xb4);

    psd.tcpLen = 24;
    ASSERT_TRUE(verifyTcpChecksum(psd, seg, sb.size()));
}

TEST_F(SegmentBuilderTest, payloadIsCopiedAfterOptions)
{
    TcpHeaderFields th = TcpHeaderFields::make(999, 9981);
    th.flags.ack = true;
    th.flags.psh = true;
    TcpOption opts[] = {TcpOption::noOperation(), TcpOption::maximumSegmentSize(536)};
    const char payload[] = "hello";

    SegmentBuilder sb(buffer, sizeof(buffer));
    ASSERT_EQ(sb.build(psd, th, opts, 2, payload, 5), ErrorCode::OK);
    ASSERT_EQ(sb.size(), 33u);
    ASSERT_EQ(buffer[12], 0x70);
    ASSERT_EQ(memcmp(buffer + 28, payload, 5), 0);
    ASSERT_EQ(buffer[33], 0xaa);

    psd.tcpLen = 33;
    ASSERT_TRUE(verifyTcpChecksum(psd, buffer, sb.size()));
}

TEST_F(SegmentBuilderTest, staleDataOffsetIsReplaced)
{
    TcpHeaderFields th = TcpHeaderFields::make(1, 2);
    th.dataOffset = 9;
    TcpOption opts[] = {TcpOption::maximumSegmentSize(1460)};

    SegmentBuilder sb(buffer, sizeof(buffer));
    ASSERT_EQ(sb.build(psd, th, opts, 1, nullptr, 0), ErrorCode::OK);
    ASSERT_EQ(buffer[12], 0x60);
}

TEST_F(SegmentBuilderTest, callerTcpLengthIsReplaced)
{
    TcpHeaderFields th = TcpHeaderFields::make(1, 2);
    psd.tcpLen = 1000;

    SegmentBuilder sb(buffer, sizeof(buffer));
    ASSERT_EQ(sb.build(psd, th, nullptr, 0, "abc", 3), ErrorCode::OK);
    psd.tcpLen = 23;
    ASSERT_TRUE(verifyTcpChecksum(psd, buffer, sb.size()));
}

TEST_F(SegmentBuilderTest, bufferTooSmallForPayload)
{
    TcpHeaderFields th = TcpHeaderFields::make(1, 2);
    std::vector<uint8_t> payload(100, 'x');

    SegmentBuilder sb(buffer, 119);
    ASSERT_EQ(sb.build(psd, th, nullptr, 0, payload.data(), payload.size()), ErrorCode::BUFFER_TOO_SMALL);
    ASSERT_EQ(sb.size(), 0u);

    SegmentBuilder fits(buffer, 120);
    ASSERT_EQ(fits.build(psd, th, nullptr, 0, payload.data(), payload.size()), ErrorCode::OK);
    ASSERT_EQ(fits.size(), 120u);
}

TEST_F(SegmentBuilderTest, bufferTooSmallForHeader)
{
    TcpHeaderFields th = TcpHeaderFields::make(1, 2);
    SegmentBuilder sb(buffer, 10);
    ASSERT_EQ(sb.build(psd, th, nullptr, 0, nullptr, 0), ErrorCode::BUFFER_TOO_SMALL);

    TcpOption opts[] = {TcpOption::maximumSegmentSize(1460)};
    SegmentBuilder noRoom(buffer, 22);
    ASSERT_EQ(noRoom.build(psd, th, opts, 1, nullptr, 0), ErrorCode::BUFFER_TOO_SMALL);
}

TEST_F(SegmentBuilderTest, lowerLayerErrorsPassThrough)
{
    TcpHeaderFields th = TcpHeaderFields::make(1, 2);
    std::vector<TcpOption> opts(11, TcpOption::maximumSegmentSize(536));
    SegmentBuilder sb(buffer, sizeof(buffer));
    ASSERT_EQ(sb.build(psd, th, opts.data(), opts.size(), nullptr, 0), ErrorCode::OPTIONS_TOO_LONG);

    std::vector<uint8_t> big(300, 0);
    TcpOption huge[] = {TcpOption::unknown(40, big.data(), big.size())};
    ASSERT_EQ(sb.build(psd, th, huge, 1, nullptr, 0), ErrorCode::OPTION_TOO_LONG);
    ASSERT_EQ(sb.size(), 0u);
}

TEST_F(SegmentBuilderTest, rebuildReusesBuffer)
{
    TcpHeaderFields th = TcpHeaderFields::make(1, 2);
    SegmentBuilder sb(buffer, sizeof(buffer));
    ASSERT_EQ(sb.build(psd, th, nullptr, 0, "abcdef", 6), ErrorCode::OK);
    ASSERT_EQ(sb.size(), 26u);
    th.flags.fin = true;
    ASSERT_EQ(sb.build(psd, th, nullptr, 0, nullptr, 0), ErrorCode::OK);
    ASSERT_EQ(sb.size(), 20u);
    ASSERT_EQ(buffer[13], 0x01);
}

TEST_F(SegmentBuilderTest, ipv4LengthLimit)
{
    TcpHeaderFields th = TcpHeaderFields::make(1, 2);
    std::vector<uint8_t> payload(65536, 0x5a);
    std::vector<uint8_t> big(70000);

    SegmentBuilder sb(big.data(), big.size());
    ASSERT_EQ(sb.build(psd, th, nullptr, 0, payload.data(), payload.size()),
              ErrorCode::BUFFER_TOO_SMALL);
    ASSERT_EQ(sb.size(), 0u);

    //largest segment an IPv4 pseudo-header can describe
    ASSERT_EQ(sb.build(psd, th, nullptr, 0, payload.data(), 0xffff - TCP_HEADER_LEN),
              ErrorCode::OK);
    ASSERT_EQ(sb.size(), 0xffffu);
    psd.tcpLen = 0xffff;
    ASSERT_TRUE(verifyTcpChecksum(psd, sb.data(), sb.size()));
}

TEST_F(SegmentBuilderTest, ipv6CarriesLengthAbove64k)
{
    uint8_t saddr[16] = {0x20, 0x01, 0x0d, 0xb8};
    uint8_t daddr[16] = {0x20, 0x01, 0x0d, 0xb8};
    saddr[15] = 1;
    daddr[15] = 2;
    PseudoHeader psd6 = PseudoHeader::ipv6(saddr, daddr, 0);
    TcpHeaderFields th = TcpHeaderFields::make(1, 2);
    std::vector<uint8_t> payload(65536, 0x5a);
    std::vector<uint8_t> big(70000);

    SegmentBuilder sb(big.data(), big.size());
    ASSERT_EQ(sb.build(psd6, th, nullptr, 0, payload.data(), payload.size()), ErrorCode::OK);
    ASSERT_EQ(sb.size(), 65556u);
    psd6.tcpLen = 65556;
    ASSERT_TRUE(verifyTcpChecksum(psd6, sb.data(), sb.size()));
}
