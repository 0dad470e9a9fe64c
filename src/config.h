#ifndef SRC_CONFIG
#define SRC_CONFIG

#include <lsf/xx.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <chrono>

namespace encdns
{
    // DoH/DoT监听配置
    struct listener_config
    {
        bool enabled_ = false;
        // TODO 可以重载json解析 uint16_t
        int port_ = 0;
        std::string cert_path_ = "/etc/ssl/certs/ndash.crt";
        std::string key_path_ = "/etc/ssl/private/ndash.key";

        JS_OBJECT(JS_MEMBER(enabled_), JS_MEMBER(port_), JS_MEMBER(cert_path_), JS_MEMBER(key_path_));
    };

    // 本地静态记录. type_: A AAAA CNAME MX TXT
    // MX的值写成 "10 mail.example.com"
    struct host_record
    {
        std::string host_;
        std::string type_ = "A";
        std::vector<std::string> values_;
        int ttl_ = 0; // 0 使用默认ttl

        JS_OBJECT(JS_MEMBER(host_), JS_MEMBER(type_), JS_MEMBER(values_), JS_MEMBER(ttl_));
    };

    struct config_struct
    {
        listener_config doh_ = {.port_ = 443};
        listener_config dot_ = {.port_ = 853};
        std::vector<std::string> forwarders_ = {"8.8.8.8", "8.8.4.4", "1.1.1.1", "1.0.0.1"};
        std::vector<host_record> host_mapping_;
        int resolve_timeout_ms_ = 5000;
        int upstream_timeout_ms_ = 2000;
        int max_frame_buffer_ = 4 * (65535 + 2);
        std::string log_level_ = "info";

        JS_OBJECT(JS_MEMBER(doh_),
                  JS_MEMBER(dot_),
                  JS_MEMBER(forwarders_),
                  JS_MEMBER(host_mapping_),
                  JS_MEMBER(resolve_timeout_ms_),
                  JS_MEMBER(upstream_timeout_ms_),
                  JS_MEMBER(max_frame_buffer_),
                  JS_MEMBER(log_level_));
    };

    // start时的配置快照
    struct service_config
    {
        listener_config doh_;
        listener_config dot_;
        std::size_t max_frame_buffer_ = 4 * (65535 + 2);
    };

    class host_table;
    class resolver_backend;

    class config
    {
    public:
        static constinit inline std::string_view CONFIG_DEFAULT_PATH = "./encdns-cfg.json";
        static std::shared_ptr<config> make_config(std::string_view config_path = CONFIG_DEFAULT_PATH);

    public:
        config(const config &) = delete;

        bool config_to(host_table &ht) const;

        // 静态表 -> 上游转发
        std::shared_ptr<resolver_backend> make_backend() const;

        service_config get_service_config() const;
        std::chrono::milliseconds get_resolve_timeout() const;
        const std::string &get_log_level() const { return cs_.log_level_; }
        const config_struct &get() const { return cs_; }

    private:
        explicit config(std::string_view config_path);

    private:
        config_struct cs_;
    };
} // namespace encdns

#endif /* SRC_CONFIG */
