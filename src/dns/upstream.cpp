#include "upstream.h"
#include "dot/framer.h"

#include <array>
#include <variant>

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <asio/experimental/awaitable_operators.hpp>

#include <openssl/rand.h>

#include <spdlog/spdlog.h>

using namespace asio::experimental::awaitable_operators;

namespace encdns
{
    using namespace net_headers;

    namespace
    {
        uint16_t random_id()
        {
            uint16_t id = 0;
            if (RAND_bytes(reinterpret_cast<unsigned char *>(&id), sizeof(id)) != 1)
            {
                throw std::runtime_error("RAND_bytes failed");
            }
            return id;
        }

        // https://www.rfc-editor.org/rfc/rfc7766#section-8 tcp同样使用2字节长度前缀
        awaitable<std::string> tcp_round_trip(ip::tcp::endpoint ep, std::string framed)
        {
            tcp_socket s(co_await this_coro::executor);
            co_await s.async_connect(ep);
            co_await async_write(s, buffer(framed));

            std::array<unsigned char, 2> len{};
            co_await async_read(s, buffer(len));
            std::string payload((len[0] << 8) | len[1], '\0');
            co_await async_read(s, buffer(payload));
            co_return payload;
        }

        std::optional<dns_message> check_reply(const std::string &wire, uint16_t id, const ip::udp::endpoint &ep)
        {
            auto reply = decode_message(wire);
            if (!reply.is_response || reply.id != id)
            {
                log::warn("upstream_forwarder: {} 响应id不匹配 {} != {}", ep.address().to_string(), reply.id, id);
                return std::nullopt;
            }
            return reply;
        }

        // https://www.rfc-editor.org/rfc/rfc5452#section-9.1 来源地址和id都对上才接受,其余丢弃继续等
        awaitable<dns_message> receive_reply(udp_socket &s, const ip::udp::endpoint &ep, uint16_t id)
        {
            std::string buf(dns_max_message, '\0');
            for (;;)
            {
                ip::udp::endpoint from;
                auto n = co_await s.async_receive_from(buffer(buf), from);
                if (from != ep)
                {
                    log::warn("upstream_forwarder: 丢弃来自 {}:{} 的响应,期望 {}:{}",
                              from.address().to_string(), from.port(), ep.address().to_string(), ep.port());
                    continue;
                }
                try
                {
                    if (auto reply = check_reply(buf.substr(0, n), id, ep))
                    {
                        co_return std::move(*reply);
                    }
                }
                catch (const decode_error &e)
                {
                    log::warn("upstream_forwarder: {} 响应解码失败 {}", ep.address().to_string(), e.what());
                }
            }
        }
    }

    upstream_forwarder::upstream_forwarder(const std::vector<std::string> &servers, std::chrono::milliseconds attempt_timeout)
        : attempt_timeout_(attempt_timeout)
    {
        for (auto &&i : servers)
        {
            servers_.push_back(parse_server(i));
        }
        if (servers_.empty())
        {
            log::warn("upstream_forwarder: 没有配置上游服务器,所有解析都会失败");
        }
    }

    ip::udp::endpoint upstream_forwarder::parse_server(std::string_view server)
    {
        std::string host{server};
        unsigned short port = 53;

        if (server.starts_with('['))
        {
            // [v6]:port
            auto close = server.find(']');
            if (close == std::string_view::npos)
                throw std::invalid_argument("invalid forwarder: " + std::string(server));
            host = server.substr(1, close - 1);
            if (close + 1 < server.size())
            {
                if (server[close + 1] != ':')
                    throw std::invalid_argument("invalid forwarder: " + std::string(server));
                port = static_cast<unsigned short>(std::stoul(std::string(server.substr(close + 2))));
            }
        }
        else if (auto colon = server.find(':'); colon != std::string_view::npos && server.find(':', colon + 1) == std::string_view::npos)
        {
            // v4:port
            host = server.substr(0, colon);
            port = static_cast<unsigned short>(std::stoul(std::string(server.substr(colon + 1))));
        }

        asio::error_code ec;
        auto addr = ip::make_address(host, ec);
        if (ec)
        {
            throw std::invalid_argument("invalid forwarder address: " + std::string(server));
        }
        return {addr, port};
    }

    awaitable<lookup_result> upstream_forwarder::lookup(std::string name, qtype_kind kind)
    {
        dns_message query;
        query.id = random_id();
        query.recursion_desired = true;
        query.questions.push_back({name, type_code(kind), IN});
        auto wire = encode_message(query);

        for (auto &&ep : servers_)
        {
            try
            {
                auto reply = co_await exchange_udp(ep, wire, query.id);
                if (reply && reply->truncated)
                {
                    log::debug("upstream_forwarder::lookup: {} 响应被截断,改用tcp", ep.address().to_string());
                    reply = co_await exchange_tcp(ep, wire, query.id);
                }
                if (!reply)
                {
                    continue;
                }
                if (reply->rcode == NXDOMAIN)
                {
                    co_return lookup_result::not_found();
                }
                if (reply->rcode != NOERROR)
                {
                    log::warn("upstream_forwarder::lookup: {} 对 {} 返回rcode {}", ep.address().to_string(), name, reply->rcode);
                    continue;
                }

                // 只要问的类型,cname链上的名字不管
                std::vector<lookup_answer> answers;
                for (auto &&rr : reply->answers)
                {
                    if (rr.type == query.questions.front().type && rr.rclass == IN)
                    {
                        answers.push_back({std::move(rr.data), rr.ttl});
                    }
                }
                co_return lookup_result::found(std::move(answers));
            }
            catch (const std::system_error &e)
            {
                if (e.code() == asio::error::operation_aborted)
                {
                    throw;
                }
                log::warn("upstream_forwarder::lookup: {} {}", ep.address().to_string(), e.what());
            }
            catch (const decode_error &e)
            {
                log::warn("upstream_forwarder::lookup: {} 响应解码失败 {}", ep.address().to_string(), e.what());
            }
        }
        co_return lookup_result::failure("no forwarder answered " + name);
    }

    awaitable<std::optional<dns_message>> upstream_forwarder::exchange_udp(ip::udp::endpoint ep, std::string query, uint16_t id)
    {
        auto ex = co_await this_coro::executor;
        udp_socket s(ex, ep.protocol());
        co_await s.async_send_to(buffer(query), ep);

        steady_timer_a t(ex);
        t.expires_after(attempt_timeout_);

        std::variant<dns_message, std::monostate> r = co_await (receive_reply(s, ep, id) || t.async_wait());
        if (r.index() != 0)
        {
            log::warn("upstream_forwarder::exchange_udp: {} 超时", ep.address().to_string());
            co_return std::nullopt;
        }
        co_return std::get<0>(std::move(r));
    }

    awaitable<std::optional<dns_message>> upstream_forwarder::exchange_tcp(ip::udp::endpoint ep, std::string query, uint16_t id)
    {
        steady_timer_a t(co_await this_coro::executor);
        t.expires_after(attempt_timeout_);

        ip::tcp::endpoint tep(ep.address(), ep.port());
        std::variant<std::string, std::monostate> r = co_await (tcp_round_trip(tep, stream_framer::frame(query)) || t.async_wait());
        if (r.index() != 0)
        {
            log::warn("upstream_forwarder::exchange_tcp: {} 超时", ep.address().to_string());
            co_return std::nullopt;
        }
        co_return check_reply(std::get<0>(r), id, ep);
    }

} // namespace encdns
