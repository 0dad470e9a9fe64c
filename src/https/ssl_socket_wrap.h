#ifndef SRC_HTTPS_SSL_SOCKET_WRAP
#define SRC_HTTPS_SSL_SOCKET_WRAP
#include "hmemory.h"
#include "asio_coroutine_net.h"

#include <asio/ssl.hpp>

namespace encdns
{
    // tls服务端连接
    // XXX 线程不安全
    class ssl_sock_mem : public memory
    {
    public:
        virtual awaitable<void> async_write_all(std::string_view) override;
        virtual void close() override;

    public:
        /// @brief
        /// @param sock 需要是准备读写状态
        /// @param ctx 监听器共享的证书上下文
        void init_server(tcp_socket &&sock, std::shared_ptr<ssl::context> ctx);

        awaitable<void> async_handshake();

        std::string remote() const { return remote_; }

        ~ssl_sock_mem();

    protected:
        virtual awaitable<std::size_t> async_read_raw(mutable_buffer b) override;

    private:
        std::shared_ptr<ssl::context> ctx_;
        // BUG https://github.com/chriskohlhoff/asio/issues/355
        // A stream object must not be destroyed while there are pending asynchronous operations associated with it.
        std::unique_ptr<ssl_socket> ssl_sock_;
        std::string remote_;
    };

} // namespace encdns

#endif /* SRC_HTTPS_SSL_SOCKET_WRAP */
