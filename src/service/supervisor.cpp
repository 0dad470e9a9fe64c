#include "supervisor.h"
#include "dot/dot_session.h"
#include "doh/doh_handler.h"

#include <spdlog/spdlog.h>

namespace encdns
{
    std::string_view to_string(start_state s)
    {
        switch (s)
        {
        case start_state::disabled:
            return "disabled";
        case start_state::skipped:
            return "skipped";
        case start_state::started:
            return "started";
        case start_state::failed:
            return "failed";
        }
        return "unknown";
    }

    supervisor::supervisor(any_io_executor ex, std::shared_ptr<query_processor> qp)
        : ex_(std::move(ex)), qp_(std::move(qp))
    {
        if (!qp_)
        {
            throw std::invalid_argument("supervisor: query_processor is null");
        }
    }

    supervisor::~supervisor()
    {
        stop();
    }

    start_report supervisor::start(const service_config &sc)
    {
        stop();

        std::lock_guard lock(mutex_);
        start_report report;

        auto doh = std::make_shared<doh_handler>(qp_);
        report.doh_ = start_one(doh_, "DoH", sc.doh_, [doh](std::shared_ptr<memory> m)
                                { return doh->serve(std::move(m)); });

        auto max_buffer = sc.max_frame_buffer_;
        report.dot_ = start_one(dot_, "DoT", sc.dot_, [qp = qp_, max_buffer](std::shared_ptr<memory> m)
                                { return serve_dot(std::move(m), qp, max_buffer); });
        return report;
    }

    listener_report supervisor::start_one(std::shared_ptr<tls_listener> &slot, const std::string &name,
                                          const listener_config &lc, connection_handler handler)
    {
        if (!lc.enabled_)
        {
            log::info("supervisor::start: {} 未启用", name);
            return {start_state::disabled, {}};
        }
        if (lc.port_ < 0 || lc.port_ > 65535)
        {
            log::error("supervisor::start: {} 端口号不合法 {}", name, lc.port_);
            return {start_state::failed, "invalid port " + std::to_string(lc.port_)};
        }

        try
        {
            auto si = load_identity(lc.cert_path_, lc.key_path_);
            if (!si)
            {
                log::warn("supervisor::start: {} 证书 {} 或私钥 {} 不存在,跳过", name, lc.cert_path_, lc.key_path_);
                return {start_state::skipped, "certificate or key not found"};
            }

            auto ci = describe(si->cert_pem_);
            auto listener = std::make_shared<tls_listener>(ex_, name, std::move(handler));
            listener->start(static_cast<uint16_t>(lc.port_), *si);
            slot = std::move(listener);

            log::info("supervisor::start: {} 证书 subject={} issuer={} 有效期 {} - {}", name, ci.subject_, ci.issuer_, ci.not_before_, ci.not_after_);
            return {start_state::started, {}};
        }
        catch (const std::exception &e)
        {
            log::error("supervisor::start: {} 启动失败 {}", name, e.what());
            return {start_state::failed, e.what()};
        }
    }

    void supervisor::stop()
    {
        std::lock_guard lock(mutex_);
        for (auto l : {&doh_, &dot_})
        {
            if (*l)
            {
                (*l)->stop();
                l->reset();
            }
        }
    }

    service_status supervisor::status() const
    {
        std::lock_guard lock(mutex_);
        auto one = [](const std::shared_ptr<tls_listener> &l)
        {
            listener_status s;
            if (l && l->running())
            {
                s.running_ = true;
                s.port_ = l->port();
            }
            return s;
        };
        return {one(doh_), one(dot_)};
    }

} // namespace encdns
