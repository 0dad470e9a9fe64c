#ifndef SRC_DNS_NET_HEADERS
#define SRC_DNS_NET_HEADERS

#include <cstdint>
#include <cstddef>

namespace encdns
{
    namespace net_headers
    {
        // https://www.rfc-editor.org/rfc/rfc1035#section-4.1.1
        // 头部固定12字节: ID FLAGS QDCOUNT ANCOUNT NSCOUNT ARCOUNT
        constexpr std::size_t dns_header_size = 12;

        constexpr uint16_t flag_qr = 0x8000;
        constexpr uint16_t flag_aa = 0x0400;
        constexpr uint16_t flag_tc = 0x0200;
        constexpr uint16_t flag_rd = 0x0100;
        constexpr uint16_t flag_ra = 0x0080;
        constexpr int opcode_shift = 11;
        constexpr uint16_t opcode_mask = 0x0f;
        constexpr uint16_t rcode_mask = 0x0f;

        // https://www.rfc-editor.org/rfc/rfc1035#section-2.3.4
        constexpr std::size_t dns_max_label = 63;
        constexpr std::size_t dns_max_name = 255;
        constexpr std::size_t dns_max_message = 65535;
        constexpr std::size_t dns_max_char_string = 255;

        // 消息压缩 https://www.rfc-editor.org/rfc/rfc1035#section-4.1.4
        constexpr uint8_t compress_mask = 0xc0;

        enum dns_type : uint16_t
        {
            A = 1,
            NS = 2,
            CNAME = 5,
            SOA = 6,
            PTR = 12,
            HINFO = 13,
            MX = 15,
            TXT = 16,
            AAAA = 28,
            SRV = 33,
            DNAME = 39,
            OPT = 41,
            DNSKEY = 48,
            ANY = 255,
        };

        // https://www.rfc-editor.org/rfc/rfc1035#section-3.2.4
        enum dns_class : uint16_t
        {
            IN = 1,
            CH = 3,
            HS = 4,
            NONE = 254,
            ANY_CLASS = 255,
        };

        enum dns_opcode : uint8_t
        {
            QUERY = 0,
            IQUERY = 1,
            STATUS = 2,
            NOTIFY = 4,
            UPDATE = 5,
        };

        // https://www.rfc-editor.org/rfc/rfc1035#section-4.1.1 RCODE
        enum dns_rcode : uint8_t
        {
            NOERROR = 0,
            FORMERR = 1,
            SERVFAIL = 2,
            NXDOMAIN = 3,
            NOTIMP = 4,
            REFUSED = 5,
        };

    } // namespace net_headers

} // namespace encdns

#endif /* SRC_DNS_NET_HEADERS */
