#ifndef SRC_DNS_WIRE
#define SRC_DNS_WIRE

#include "dns/net-headers.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <stdexcept>

#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

namespace encdns
{
    // 畸形或截断的dns消息
    class decode_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // 模型无法表示成合法的dns消息,例如标签超过63字节
    class encode_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // 本服务能解析的查询类型,其余都是unsupported,但原始类型码仍然保留
    enum class qtype_kind
    {
        A,
        AAAA,
        CNAME,
        MX,
        TXT,
        unsupported
    };

    qtype_kind kind_of(uint16_t type);
    uint16_t type_code(qtype_kind kind);
    std::string type_name(uint16_t type);

    struct dns_question
    {
        std::string name;
        uint16_t type = net_headers::A;
        uint16_t qclass = net_headers::IN;

        qtype_kind kind() const { return kind_of(type); }
        bool operator==(const dns_question &) const = default;
    };

    struct domain_name
    {
        std::string name;
        bool operator==(const domain_name &) const = default;
    };

    struct mx_data
    {
        uint16_t preference = 0;
        std::string exchange;
        bool operator==(const mx_data &) const = default;
    };

    // 每个元素是一个character-string
    struct txt_data
    {
        std::vector<std::string> strings;

        std::string joined() const;
        bool operator==(const txt_data &) const = default;
    };

    // 不认识的类型(OPT SOA...)原样保存
    struct raw_rdata
    {
        std::string bytes;
        bool operator==(const raw_rdata &) const = default;
    };

    using rdata = std::variant<asio::ip::address_v4, asio::ip::address_v6, domain_name, mx_data, txt_data, raw_rdata>;

    // https://www.rfc-editor.org/rfc/rfc1035#section-4.1.3
    struct dns_record
    {
        std::string name;
        uint16_t type = net_headers::A;
        uint16_t rclass = net_headers::IN;
        uint32_t ttl = 0;
        rdata data;

        bool operator==(const dns_record &) const = default;
    };

    struct dns_message
    {
        uint16_t id = 0;
        bool is_response = false;
        uint8_t opcode = net_headers::QUERY;
        bool authoritative = false;
        bool truncated = false;
        bool recursion_desired = false;
        bool recursion_available = false;
        uint8_t rcode = net_headers::NOERROR;

        std::vector<dns_question> questions;
        std::vector<dns_record> answers;
        std::vector<dns_record> authorities;
        std::vector<dns_record> additionals;
    };

    /// @brief 解析完整的dns消息,任何不一致都抛出decode_error
    /// @param wire 不包含DoT的长度前缀
    dns_message decode_message(std::string_view wire);

    /// @brief 编码时总是设置RD和RA,rcode非0时不写回答部分.不产生压缩指针
    std::string encode_message(const dns_message &m);

    // 只要有2个字节就能拿到事务id
    std::optional<uint16_t> peek_id(std::string_view wire);

    /* "foo.bar" -> "\003foo\003bar\000"
     * "foo.bar." -> "\003foo\003bar\000"
     */
    std::string encode_name(std::string_view name);

    std::string to_lower(std::string_view s);

    // 大小写不敏感,忽略结尾的'.'
    bool name_equal(std::string_view a, std::string_view b);

} // namespace encdns

#endif /* SRC_DNS_WIRE */
