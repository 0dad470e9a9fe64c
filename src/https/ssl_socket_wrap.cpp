#include "ssl_socket_wrap.h"

#include <asio/write.hpp>
#include <asio/as_tuple.hpp>

#include <spdlog/spdlog.h>

namespace encdns
{
    awaitable<std::size_t> ssl_sock_mem::async_read_raw(mutable_buffer b)
    {
        auto [e, n] = co_await ssl_sock_->async_read_some(b, as_tuple(use_awaitable));
        if (e && e != error::eof && e != ssl::error::stream_truncated)
        {
            log::debug("ssl_sock_mem::async_read_raw: {} {}", remote_, e.message());
        }
        if (e)
        {
            // XXX 如何关闭呢 https://www.rfc-editor.org/rfc/rfc5246#section-7.2.1
            co_return 0;
        }
        co_return n;
    }

    awaitable<void> ssl_sock_mem::async_write_all(std::string_view s)
    {
        if (!write_ok_)
        {
            co_return;
        }
        auto [e, n] = co_await async_write(*ssl_sock_, buffer(s, s.size()), as_tuple(use_awaitable));
        if (e)
        {
            log::warn("ssl_sock_mem::async_write_all: {} {}", remote_, e.message());
            write_ok_ = false;
        }
    }

    void ssl_sock_mem::init_server(tcp_socket &&sock, std::shared_ptr<ssl::context> ctx)
    {
        asio::error_code ec;
        auto ep = sock.remote_endpoint(ec);
        if (!ec)
        {
            remote_ = ep.address().to_string() + ":" + std::to_string(ep.port());
        }
        ctx_ = std::move(ctx);
        ssl_sock_ = std::make_unique<ssl_socket>(std::move(sock), *ctx_);
    }

    awaitable<void> ssl_sock_mem::async_handshake()
    {
        co_await ssl_sock_->async_handshake(ssl::stream_base::server);
    }

    void ssl_sock_mem::close()
    {
        read_ok_ = write_ok_ = false;
        if (!ssl_sock_)
        {
            return;
        }
        asio::error_code ec;
        ssl_sock_->lowest_layer().shutdown(ip::tcp::socket::shutdown_both, ec);
        ssl_sock_->lowest_layer().close(ec);
    }

    ssl_sock_mem::~ssl_sock_mem()
    {
        close();
        log::debug("~ssl_sock_mem: {}", remote_);
    }

} // namespace encdns
