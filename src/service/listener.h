#ifndef SRC_SERVICE_LISTENER
#define SRC_SERVICE_LISTENER

#include "asio_coroutine_net.h"
#include "hmemory.h"
#include "certificate/cert.h"

#include <asio/strand.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace encdns
{
    // 握手完成之后,处理一个连接上的所有请求
    using connection_handler = std::function<awaitable<void>(std::shared_ptr<memory>)>;

    // tls over tcp监听,每个连接一个协程
    class tls_listener : public std::enable_shared_from_this<tls_listener>
    {
    public:
        static constexpr std::chrono::seconds handshake_timeout{10};
        // accept出错(比如EMFILE)之后等一会再试
        static constexpr std::chrono::milliseconds accept_retry_delay{100};

        tls_listener(any_io_executor ex, std::string name, connection_handler handler);

        tls_listener(const tls_listener &) = delete;
        tls_listener &operator=(const tls_listener &) = delete;

        /// @brief 同步绑定端口并开始接受连接,证书或绑定失败时抛出异常
        /// @param port 0 由系统分配
        void start(uint16_t port, const subject_identify &si);

        // 可重复调用,可以在任意线程调用.关闭acceptor投递到strand上执行
        void stop();

        bool running() const;

        // 实际绑定的端口
        std::optional<uint16_t> port() const;

        const std::string &name() const { return name_; }

        std::size_t accept_errors() const { return accept_errors_; }

    private:
        awaitable<void> accept_loop(std::shared_ptr<tcp_acceptor> acceptor);
        awaitable<void> handle(tcp_socket sock);

    private:
        any_io_executor ex_;
        // acceptor只在这个strand上操作
        strand<any_io_executor> strand_;
        std::string name_;
        connection_handler handler_;

        std::shared_ptr<ssl::context> ctx_;
        std::shared_ptr<tcp_acceptor> acceptor_;
        uint16_t port_ = 0;
        bool running_ = false;
        std::atomic<std::size_t> accept_errors_ = 0;
        mutable std::mutex mutex_;
    };

} // namespace encdns

#endif /* SRC_SERVICE_LISTENER */
