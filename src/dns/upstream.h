#ifndef SRC_DNS_UPSTREAM
#define SRC_DNS_UPSTREAM

#include "dns/resolver.h"

#include <vector>
#include <string>
#include <chrono>
#include <optional>

namespace encdns
{
    // 依次询问配置的上游服务器,不做连接池和负载均衡
    class upstream_forwarder : public resolver_backend
    {
    public:
        /// @param servers "8.8.8.8" "1.1.1.1:53" "[2606:4700::1111]:53"
        upstream_forwarder(const std::vector<std::string> &servers, std::chrono::milliseconds attempt_timeout = std::chrono::seconds(2));

        awaitable<lookup_result> lookup(std::string name, qtype_kind kind) override;

        const std::vector<ip::udp::endpoint> &servers() const { return servers_; }

        static ip::udp::endpoint parse_server(std::string_view server);

    private:
        awaitable<std::optional<dns_message>> exchange_udp(ip::udp::endpoint ep, std::string query, uint16_t id);
        awaitable<std::optional<dns_message>> exchange_tcp(ip::udp::endpoint ep, std::string query, uint16_t id);

        std::vector<ip::udp::endpoint> servers_;
        std::chrono::milliseconds attempt_timeout_;
    };

} // namespace encdns

#endif /* SRC_DNS_UPSTREAM */
