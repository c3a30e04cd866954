#include <Tcpwire/ChecksumCalc.hpp>
#include <string.h>

PseudoHeader PseudoHeader::ipv4(const uint8_t *saddr, const uint8_t *daddr, uint16_t tcpLen)
{
    PseudoHeader psd;
    memset(&psd, 0, sizeof(psd));
    psd.family = Family::IPV4;
    memcpy(psd.saddr, saddr, 4);
    memcpy(psd.daddr, daddr, 4);
    psd.protocol = TCP_PROTOCOL_NUMBER;
    psd.tcpLen = tcpLen;
    return psd;
}

PseudoHeader PseudoHeader::ipv4(uint32_t saddr, uint32_t daddr, uint16_t tcpLen)
{
    //network order in memory is already the wire order
    return ipv4((const uint8_t *)&saddr, (const uint8_t *)&daddr, tcpLen);
}

PseudoHeader PseudoHeader::ipv6(const uint8_t *saddr, const uint8_t *daddr, uint32_t tcpLen)
{
    PseudoHeader psd;
    memset(&psd, 0, sizeof(psd));
    psd.family = Family::IPV6;
    memcpy(psd.saddr, saddr, 16);
    memcpy(psd.daddr, daddr, 16);
    psd.protocol = TCP_PROTOCOL_NUMBER;
    psd.tcpLen = tcpLen;
    return psd;
}

ChecksumCalc::ChecksumCalc()
:sum_(0), odd_(false)
{
}

void ChecksumCalc::update(const void *data, size_t len)
{
    const uint8_t *ptr = (const uint8_t *)data;
    if (len == 0)
    {
        return;
    }

    //low byte of the word started by the previous update
    if (odd_)
    {
        sum_ += *ptr++;
        len--;
        odd_ = false;
    }

    while (len > 1)
    {
        /*  This is the inner loop */
        sum_ += ((uint32_t)ptr[0] << 8) | ptr[1];
        ptr += 2;
        len -= 2;
    }

    /*  Add left-over byte, if any */
    if (len > 0)
    {
        sum_ += (uint32_t)ptr[0] << 8;
        odd_ = true;
    }
}

void ChecksumCalc::update(const PseudoHeader &psd)
{
    if (psd.family == PseudoHeader::Family::IPV4)
    {
        // saddr | daddr | zero | ptcl | tcp length
        uint8_t hdr[12];
        memcpy(hdr, psd.saddr, 4);
        memcpy(hdr + 4, psd.daddr, 4);
        hdr[8] = 0;
        hdr[9] = psd.protocol;
        hdr[10] = (uint8_t)(psd.tcpLen >> 8);
        hdr[11] = (uint8_t)psd.tcpLen;
        update(hdr, sizeof(hdr));
    }
    else
    {
        // saddr | daddr | upper-layer length (32) | zero (24) | next header
        uint8_t hdr[40];
        memcpy(hdr, psd.saddr, 16);
        memcpy(hdr + 16, psd.daddr, 16);
        hdr[32] = (uint8_t)(psd.tcpLen >> 24);
        hdr[33] = (uint8_t)(psd.tcpLen >> 16);
        hdr[34] = (uint8_t)(psd.tcpLen >> 8);
        hdr[35] = (uint8_t)psd.tcpLen;
        hdr[36] = 0;
        hdr[37] = 0;
        hdr[38] = 0;
        hdr[39] = psd.protocol;
        update(hdr, sizeof(hdr));
    }
}

uint16_t ChecksumCalc::finalize() const
{
    uint64_t sum = sum_;

    /*  Fold 64-bit sum to 16 bits */
    while (sum >> 16)
        sum = (sum & 0xffff) + (sum >> 16);

    return (uint16_t)~sum;
}

uint16_t checksum(const void *addr, size_t count, uint32_t startSum)
{
    /* Compute Internet Checksum for "count" bytes
     *         beginning at location "addr".
     * Taken from https://tools.ietf.org/html/rfc1071
     */
    ChecksumCalc calc;
    uint8_t start[4] = {
        (uint8_t)(startSum >> 24),
        (uint8_t)(startSum >> 16),
        (uint8_t)(startSum >> 8),
        (uint8_t)startSum};
    calc.update(start, sizeof(start));
    calc.update(addr, count);
    return calc.finalize();
}

uint16_t calcTcpChecksum(const PseudoHeader &psd,
                        const uint8_t *header, size_t headerLen,
                        const uint8_t *options, size_t optionsLen,
                        const uint8_t *payload, size_t payloadLen)
{
    ChecksumCalc calc;
    calc.update(psd);
    if (headerLen >= 18)
    {
        calc.update(header, 16);
        //checksum field counts as zero, skip it
        uint8_t zero[2] = {0, 0};
        calc.update(zero, sizeof(zero));
        calc.update(header + 18, headerLen - 18);
    }
    else
    {
        calc.update(header, headerLen);
    }
    calc.update(options, optionsLen);
    calc.update(payload, payloadLen);
    return calc.finalize();
}

bool verifyTcpChecksum(const PseudoHeader &psd, const uint8_t *segment, size_t len)
{
    ChecksumCalc calc;
    calc.update(psd);
    calc.update(segment, len);
    return calc.finalize() == 0;
}
