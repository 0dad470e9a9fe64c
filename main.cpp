#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <thread>
#include <vector>

#include "config.h"
#include "certificate/cert.h"
#include "dns/resolver.h"
#include "service/supervisor.h"

namespace
{
    // 给配置里缺少证书的监听器生成自签名证书
    int gen_cert(const encdns::config &c)
    {
        std::optional<encdns::subject_identify> si;
        for (auto &&lc : {c.get().doh_, c.get().dot_})
        {
            if (encdns::load_identity(lc.cert_path_, lc.key_path_))
            {
                spdlog::info("gen_cert: {} 已存在,跳过", lc.cert_path_);
                continue;
            }
            if (!si)
            {
                si = encdns::make_self_signed();
            }
            encdns::save_identity(*si, lc.cert_path_, lc.key_path_);
        }
        return 0;
    }

    void log_status(const encdns::service_status &st)
    {
        auto port = [](auto &&p)
        { return p ? std::to_string(*p) : std::string("-"); };
        spdlog::info("status: doh running={} port={} dot running={} port={}",
                  st.doh_.running_, port(st.doh_.port_), st.dot_.running_, port(st.dot_.port_));
    }
}

int main(int argc, char **argv)
{
    try
    {
        spdlog::set_pattern("\033[1;37m[%Y-%m-%d %H:%M:%S.%e] [%t] [%^%l%$]\033[0m %v");

        std::vector<std::string_view> args(argv + 1, argv + argc);
        bool gen = !args.empty() && args.front() == "--gen-cert";
        if (gen)
        {
            args.erase(args.begin());
        }
        std::string cfg_path{encdns::config::CONFIG_DEFAULT_PATH};
        if (!args.empty())
        {
            cfg_path = args.front();
        }

        auto c = encdns::config::make_config(cfg_path);
        spdlog::set_level(spdlog::level::from_str(c->get_log_level()));
        spdlog::cfg::load_env_levels();
        spdlog::debug("encdns launch");

        if (gen)
        {
            return gen_cert(*c);
        }

        asio::io_context io_context;

        auto qp = std::make_shared<encdns::query_processor>(c->make_backend(), c->get_resolve_timeout());
        encdns::supervisor sv(io_context.get_executor(), qp);

        auto report = sv.start(c->get_service_config());
        spdlog::info("start: doh {} dot {}", encdns::to_string(report.doh_.state_), encdns::to_string(report.dot_.state_));
        auto st = sv.status();
        log_status(st);
        if (!st.doh_.running_ && !st.dot_.running_)
        {
            spdlog::error("没有运行中的监听器,退出");
            return 1;
        }

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](auto, auto)
                           {
                               spdlog::info("收到退出信号");
                               sv.stop();
                               io_context.stop(); });

        auto create_thread = [&](auto self, int i) -> void
        {
            if (i > 0)
            {
                spdlog::debug("线程{}创建成功", i);
                std::jthread j(self, self, i - 1);
                while (!io_context.stopped())
                {
                    try
                    {
                        io_context.run();
                    }
                    catch (const std::exception &e)
                    {
                        spdlog::error("main: {}", e.what());
                    }
                }
                j.join();
                spdlog::debug("线程{}退出成功", i);
            }
        };
        auto core_size = std::thread::hardware_concurrency() % 32;
        // 为了防止对象在多线程情况下销毁出问题
        std::jthread t(create_thread, create_thread, core_size);

        io_context.run();
    }
    catch (std::exception &e)
    {
        spdlog::error("main: {}", e.what());
        return 1;
    }
    return 0;
}
