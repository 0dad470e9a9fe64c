#include "config.h"
#include "dns/host_table.h"
#include "dns/upstream.h"

#include <filesystem>
#include <cstdlib>

#include <spdlog/spdlog.h>

import lsf;

namespace encdns
{
    namespace
    {
        // XXX 只处理 ~/ 开头,不处理 ~user
        void replace_path(std::string &i)
        {
            if (i.starts_with("~"))
            {
                auto path_prefix = std::getenv("HOME");
                if (path_prefix != nullptr)
                {
                    i = path_prefix + i.substr(1);
                }
                else
                {
                    spdlog::warn("没有HOME系统变量,不处理 ~");
                }
            }
        }

    }

    std::shared_ptr<config> config::make_config(std::string_view config_path)
    {
        return std::shared_ptr<config>(new config(config_path));
    }

    config::config(std::string_view config_path)
    {
        if (!std::filesystem::exists(config_path))
        {
            spdlog::warn("文件不存在: {} 跳过初始化,使用默认设置", config_path);
            return;
        }
        lsf::Json j;

        auto res = j.run(std::make_unique<lsf::FileSource>(std::string(config_path)));
        if (!res)
        {
            spdlog::error("{} : {}", config_path, j.get_errors());
            throw std::runtime_error("解析config出错");
        }
        lsf::json_to_struct_ignore_absence(*res, cs_);

        replace_path(cs_.doh_.cert_path_);
        replace_path(cs_.doh_.key_path_);
        replace_path(cs_.dot_.cert_path_);
        replace_path(cs_.dot_.key_path_);
        spdlog::info("加载配置 {} 成功", config_path);
    }

    bool config::config_to(host_table &ht) const
    {
        ht.load_hm(cs_.host_mapping_);
        return true;
    }

    std::shared_ptr<resolver_backend> config::make_backend() const
    {
        auto timeout = std::chrono::milliseconds(cs_.upstream_timeout_ms_ > 0 ? cs_.upstream_timeout_ms_ : 2000);
        auto up = std::make_shared<upstream_forwarder>(cs_.forwarders_, timeout);
        auto ht = std::make_shared<host_table>(std::move(up));
        config_to(*ht);
        return ht;
    }

    service_config config::get_service_config() const
    {
        service_config sc{cs_.doh_, cs_.dot_};
        if (cs_.max_frame_buffer_ < 65535 + 2)
        {
            spdlog::warn("max_frame_buffer_ {} 太小,至少要放下一个完整帧,使用 {}", cs_.max_frame_buffer_, 65535 + 2);
            sc.max_frame_buffer_ = 65535 + 2;
        }
        else
        {
            sc.max_frame_buffer_ = static_cast<std::size_t>(cs_.max_frame_buffer_);
        }
        return sc;
    }

    std::chrono::milliseconds config::get_resolve_timeout() const
    {
        return std::chrono::milliseconds(cs_.resolve_timeout_ms_);
    }

} // namespace encdns
