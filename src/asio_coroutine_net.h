#ifndef ASIO_COROUTINE_NET_H
#define ASIO_COROUTINE_NET_H

#include <asio/awaitable.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

#include <asio/ip/tcp.hpp>
#include <asio/ip/udp.hpp>
#include <asio/ssl.hpp>
#include <asio/steady_timer.hpp>

#include <spdlog/spdlog.h>

namespace encdns
{
    using namespace asio;
    using tcp_socket = use_awaitable_t<>::as_default_on_t<ip::tcp::socket>;
    using tcp_acceptor = use_awaitable_t<>::as_default_on_t<ip::tcp::acceptor>;
    using udp_socket = use_awaitable_t<>::as_default_on_t<ip::udp::socket>;
    using steady_timer_a = use_awaitable_t<>::as_default_on_t<steady_timer>;
    using ssl_socket = ssl::stream<tcp_socket>;

    namespace log = spdlog;

    // co_spawn的完成回调,记录协程里逃逸的异常
    inline auto log_exception(std::string where)
    {
        return [where = std::move(where)](std::exception_ptr eptr)
        {
            try
            {
                if (eptr)
                    std::rethrow_exception(eptr);
            }
            catch (const std::exception &e)
            {
                log::error("{}: {}", where, e.what());
            }
        };
    }
} // namespace encdns

#endif
