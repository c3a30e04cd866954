#ifndef TCPWIRE_CHECKSUMCALC_HPP
#define TCPWIRE_CHECKSUMCALC_HPP

#include <stddef.h>
#include <stdint.h>

constexpr const uint8_t TCP_PROTOCOL_NUMBER = 0x06;

//Virtual header prepended for the checksum only, never transmitted.
//Supplied by the IP layer.
struct PseudoHeader{
    enum class Family{
        IPV4,
        IPV6
    };

    Family family;
    //IPv4 uses the first 4 bytes
    uint8_t saddr[16];
    uint8_t daddr[16];
    //protocol for IPv4, next header for IPv6
    uint8_t protocol;
    //16 bits on IPv4, 32 bits on IPv6
    uint32_t tcpLen;

    static PseudoHeader ipv4(const uint8_t *saddr, const uint8_t *daddr, uint16_t tcpLen);

    //addresses in network byte order, as they sit in an iphdr
    static PseudoHeader ipv4(uint32_t saddr, uint32_t daddr, uint16_t tcpLen);

    static PseudoHeader ipv6(const uint8_t *saddr, const uint8_t *daddr, uint32_t tcpLen);
};

//16-bit one's complement sum, RFC 1071.
//Words are read big-endian. An odd byte left over by one update()
//pairs with the first byte of the next one, so a buffer may be fed in pieces.
class ChecksumCalc
{
public:
    ChecksumCalc();

    void update(const void *data, size_t len);

    void update(const PseudoHeader &psd);

    //Pads a pending odd byte with zero, folds the carries and returns the
    //one's complement. 0x0000 is a legal result for TCP.
    uint16_t finalize() const;

private:
    uint64_t sum_;
    bool odd_;
};

uint16_t checksum(const void *addr, size_t count, uint32_t startSum);

//Checksum over pseudo-header, header, options and payload.
//Bytes 16-17 of the header are treated as zero whatever they hold.
uint16_t calcTcpChecksum(const PseudoHeader &psd,
                        const uint8_t *header, size_t headerLen,
                        const uint8_t *options, size_t optionsLen,
                        const uint8_t *payload, size_t payloadLen);

//Sums the segment with its on-wire checksum, a valid segment folds to zero.
bool verifyTcpChecksum(const PseudoHeader &psd, const uint8_t *segment, size_t len);

#endif
