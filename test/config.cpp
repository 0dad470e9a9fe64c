#include "config.h"
#include "dns/resolver.h"
#include "certificate/cert.h"
#include "service/supervisor.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>

using namespace encdns;

namespace
{
    std::string write_tmp(std::string name, std::string content)
    {
        auto p = std::filesystem::temp_directory_path() / name;
        std::ofstream ofs(p);
        ofs << content;
        return p.string();
    }
}

TEST_CASE("missing config file gives defaults")
{
    auto c = config::make_config("/nonexistent/encdns-cfg.json");
    auto &cs = c->get();
    CHECK_FALSE(cs.doh_.enabled_);
    CHECK(cs.doh_.port_ == 443);
    CHECK(cs.dot_.port_ == 853);
    CHECK(cs.dot_.cert_path_ == "/etc/ssl/certs/ndash.crt");
    CHECK(cs.dot_.key_path_ == "/etc/ssl/private/ndash.key");
    CHECK(cs.forwarders_.size() == 4);
    CHECK(c->get_resolve_timeout() == std::chrono::milliseconds(5000));
    CHECK(c->get_log_level() == "info");

    auto sc = c->get_service_config();
    CHECK(sc.max_frame_buffer_ == 4 * (65535 + 2));
    CHECK(c->make_backend() != nullptr);
}

TEST_CASE("config file overrides defaults")
{
    auto path = write_tmp("encdns-cfg-test.json", R"({
        "dot_": {"enabled_": true, "port_": 8853, "cert_path_": "~/dot.crt", "key_path_": "/tmp/dot.key"},
        "forwarders_": ["127.0.0.1:5353"],
        "host_mapping_": [{"host_": "router.lan", "type_": "A", "values_": ["192.168.1.1"], "ttl_": 60}],
        "resolve_timeout_ms_": 1500,
        "log_level_": "debug"
    })");
    auto c = config::make_config(path);
    auto &cs = c->get();
    CHECK(cs.dot_.enabled_);
    CHECK(cs.dot_.port_ == 8853);
    CHECK(cs.dot_.key_path_ == "/tmp/dot.key");
    if (auto home = std::getenv("HOME"))
    {
        CHECK(cs.dot_.cert_path_ == std::string(home) + "/dot.crt");
    }
    CHECK_FALSE(cs.doh_.enabled_);
    CHECK(cs.forwarders_ == std::vector<std::string>{"127.0.0.1:5353"});
    REQUIRE(cs.host_mapping_.size() == 1);
    CHECK(cs.host_mapping_[0].ttl_ == 60);
    CHECK(c->get_resolve_timeout() == std::chrono::milliseconds(1500));
    CHECK(c->get_log_level() == "debug");
    CHECK(c->make_backend() != nullptr);
    std::filesystem::remove(path);
}

TEST_CASE("bad config is an error")
{
    auto path = write_tmp("encdns-cfg-bad.json", R"({"dot_": )");
    CHECK_THROWS_AS(config::make_config(path), std::runtime_error);
    std::filesystem::remove(path);

    auto hm = write_tmp("encdns-cfg-hm.json", R"({"host_mapping_": [{"host_": "x", "type_": "A", "values_": ["nope"], "ttl_": 0}]})");
    auto c2 = config::make_config(hm);
    CHECK_THROWS_AS(c2->make_backend(), std::invalid_argument);
    std::filesystem::remove(hm);
}

TEST_CASE("invalid port on one listener leaves the other running")
{
    auto dir = std::filesystem::temp_directory_path() / "encdns-cfg-port";
    std::filesystem::remove_all(dir);
    auto cert = (dir / "server.crt").string();
    auto key = (dir / "server.key").string();
    save_identity(make_self_signed(), cert, key);

    auto path = write_tmp("encdns-cfg-port.json",
                          R"({"doh_": {"enabled_": true, "port_": 70000, "cert_path_": ")" + cert + R"(", "key_path_": ")" + key + R"("},)"
                          R"( "dot_": {"enabled_": true, "port_": 0, "cert_path_": ")" + cert + R"(", "key_path_": ")" + key + R"("}})");
    auto c = config::make_config(path);
    service_config sc;
    REQUIRE_NOTHROW(sc = c->get_service_config());

    asio::io_context ioc;
    supervisor sv(ioc.get_executor(), std::make_shared<query_processor>(c->make_backend()));
    auto report = sv.start(sc);
    CHECK(report.doh_.state_ == start_state::failed);
    CHECK(report.dot_.state_ == start_state::started);
    CHECK(sv.status().dot_.running_);
    sv.stop();

    std::filesystem::remove(path);
    std::filesystem::remove_all(dir);
}
