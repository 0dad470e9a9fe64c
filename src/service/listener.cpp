#include "listener.h"
#include "https/ssl_socket_wrap.h"

#include <variant>

#include <asio/as_tuple.hpp>
#include <asio/dispatch.hpp>
#include <asio/experimental/awaitable_operators.hpp>

#include <spdlog/spdlog.h>

using namespace asio::experimental::awaitable_operators;

namespace encdns
{
    tls_listener::tls_listener(any_io_executor ex, std::string name, connection_handler handler)
        : ex_(std::move(ex)), strand_(make_strand(ex_)), name_(std::move(name)), handler_(std::move(handler))
    {
    }

    void tls_listener::start(uint16_t port, const subject_identify &si)
    {
        std::lock_guard lock(mutex_);
        if (running_)
        {
            throw std::logic_error(name_ + " 已经在运行");
        }

        // https://www.rfc-editor.org/rfc/rfc7858#section-3.2 至少tls1.2
        auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
        ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                         ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);
        // HACK 注意 证书链要在私钥之前
        ctx->use_certificate_chain(asio::buffer(si.cert_pem_));
        ctx->use_private_key(asio::buffer(si.pkey_pem_), ssl::context::pem);

        auto acceptor = std::make_shared<tcp_acceptor>(strand_);
        ip::tcp::endpoint ep(ip::tcp::v4(), port);
        acceptor->open(ep.protocol());
        acceptor->set_option(ip::tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();

        port_ = acceptor->local_endpoint().port();
        ctx_ = std::move(ctx);
        acceptor_ = acceptor;
        running_ = true;

        co_spawn(strand_, accept_loop(std::move(acceptor)), log_exception(name_ + " accept_loop"));
        log::info("tls_listener::start: {} 监听端口 {}", name_, port_);
    }

    void tls_listener::stop()
    {
        std::shared_ptr<tcp_acceptor> acceptor;
        {
            std::lock_guard lock(mutex_);
            if (!running_)
            {
                return;
            }
            running_ = false;
            acceptor = std::move(acceptor_);
        }
        // accept_loop可能正挂在别的线程的async_accept上,不能直接在这里close
        dispatch(strand_, [acceptor, name = name_]
                 {
                     asio::error_code ec;
                     acceptor->close(ec);
                     if (ec)
                     {
                         log::warn("tls_listener::stop: {} {}", name, ec.message());
                     } });
        log::info("tls_listener::stop: {} 已停止", name_);
    }

    bool tls_listener::running() const
    {
        std::lock_guard lock(mutex_);
        return running_;
    }

    std::optional<uint16_t> tls_listener::port() const
    {
        std::lock_guard lock(mutex_);
        if (!running_)
        {
            return std::nullopt;
        }
        return port_;
    }

    awaitable<void> tls_listener::accept_loop(std::shared_ptr<tcp_acceptor> acceptor)
    {
        auto self = shared_from_this();
        steady_timer_a retry(strand_);
        while (true)
        {
            auto [e, sock] = co_await acceptor->async_accept(ex_, as_tuple(use_awaitable));
            if (e)
            {
                if (e == error::operation_aborted || !running())
                {
                    break;
                }
                ++accept_errors_;
                log::warn("tls_listener::accept_loop: {} {}", name_, e.message());
                retry.expires_after(accept_retry_delay);
                co_await retry.async_wait(as_tuple(use_awaitable));
                continue;
            }
            co_spawn(ex_, handle(std::move(sock)), log_exception(name_ + " connection"));
        }
        log::debug("tls_listener::accept_loop: {} 退出", name_);
    }

    awaitable<void> tls_listener::handle(tcp_socket sock)
    {
        auto self = shared_from_this();
        auto mem = std::make_shared<ssl_sock_mem>();
        mem->init_server(std::move(sock), ctx_);

        steady_timer_a t(co_await this_coro::executor);
        t.expires_after(handshake_timeout);
        try
        {
            std::variant<std::monostate, std::monostate> r = co_await (mem->async_handshake() || t.async_wait());
            if (r.index() != 0)
            {
                log::debug("tls_listener::handle: {} {} 握手超时", name_, mem->remote());
                mem->close();
                co_return;
            }
        }
        catch (const std::system_error &e)
        {
            log::debug("tls_listener::handle: {} {} 握手失败 {}", name_, mem->remote(), e.what());
            mem->close();
            co_return;
        }

        log::debug("tls_listener::handle: {} 新连接 {}", name_, mem->remote());
        co_await handler_(mem);
    }

} // namespace encdns
