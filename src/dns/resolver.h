#ifndef SRC_DNS_RESOLVER
#define SRC_DNS_RESOLVER

#include "dns/wire.h"
#include "asio_coroutine_net.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace encdns
{
    enum class lookup_status
    {
        ok,
        not_found,
        failure
    };

    struct lookup_answer
    {
        rdata data;
        // 后端不提供时使用默认ttl
        std::optional<uint32_t> ttl;
    };

    // not_found对应NXDOMAIN,failure对应SERVFAIL
    struct lookup_result
    {
        lookup_status status_ = lookup_status::ok;
        std::vector<lookup_answer> answers_;
        std::string error_;

        static lookup_result found(std::vector<lookup_answer> answers)
        {
            return {lookup_status::ok, std::move(answers), {}};
        }
        static lookup_result not_found()
        {
            return {lookup_status::not_found, {}, {}};
        }
        static lookup_result failure(std::string why)
        {
            return {lookup_status::failure, {}, std::move(why)};
        }
    };

    // 外部的解析能力.kind不会是unsupported
    class resolver_backend
    {
    public:
        virtual awaitable<lookup_result> lookup(std::string name, qtype_kind kind) = 0;
        virtual ~resolver_backend() = default;
    };

    dns_message make_response(const dns_message &query, uint8_t rcode);

    // 解码失败时用的SERVFAIL,不带问题部分
    std::string servfail_response(uint16_t id);

    class query_processor
    {
    public:
        static constexpr uint32_t default_ttl = 300;

        /// @param timeout 单次解析的超时,0表示不限制
        query_processor(std::shared_ptr<resolver_backend> backend, std::chrono::milliseconds timeout = std::chrono::seconds(5));

        /// @brief 二进制查询 -> 二进制响应.解码和解析的错误都转换成dns响应码
        awaitable<std::string> process(std::string wire);

        /// @brief 逐个解析问题,第一个失败的问题决定响应码并停止
        awaitable<dns_message> respond(dns_message query);

        awaitable<lookup_result> resolve(dns_question q);

    private:
        std::shared_ptr<resolver_backend> backend_;
        std::chrono::milliseconds timeout_;
    };

} // namespace encdns

#endif /* SRC_DNS_RESOLVER */
