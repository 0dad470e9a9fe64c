#ifndef SRC_SERVICE_SUPERVISOR
#define SRC_SERVICE_SUPERVISOR

#include "service/listener.h"
#include "dns/resolver.h"
#include "config.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace encdns
{
    enum class start_state
    {
        disabled,
        skipped, // 证书或私钥不存在
        started,
        failed
    };

    std::string_view to_string(start_state s);

    struct listener_report
    {
        start_state state_ = start_state::disabled;
        std::string error_;
    };

    struct start_report
    {
        listener_report doh_;
        listener_report dot_;
    };

    struct listener_status
    {
        bool running_ = false;
        std::optional<uint16_t> port_;
    };

    // 每次调用时计算
    struct service_status
    {
        listener_status doh_;
        listener_status dot_;
    };

    // DoH和DoT监听器的生命周期,两者互不影响
    class supervisor
    {
    public:
        supervisor(any_io_executor ex, std::shared_ptr<query_processor> qp);
        ~supervisor();

        supervisor(const supervisor &) = delete;
        supervisor &operator=(const supervisor &) = delete;

        /// @brief 运行中再次调用会先stop,配置在这里快照
        start_report start(const service_config &sc);

        void stop();

        service_status status() const;

    private:
        listener_report start_one(std::shared_ptr<tls_listener> &slot, const std::string &name,
                                  const listener_config &lc, connection_handler handler);

    private:
        any_io_executor ex_;
        std::shared_ptr<query_processor> qp_;

        std::shared_ptr<tls_listener> doh_;
        std::shared_ptr<tls_listener> dot_;
        mutable std::mutex mutex_;
    };

} // namespace encdns

#endif /* SRC_SERVICE_SUPERVISOR */
