#include "service/supervisor.h"
#include "dot/framer.h"
#include "../test_util.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <thread>

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <asio/ssl.hpp>

using namespace encdns;
using namespace encdns::net_headers;

namespace
{
    std::shared_ptr<query_processor> processor()
    {
        auto b = std::make_shared<test::fake_backend>();
        b->results_["example.com"] = lookup_result::found({{asio::ip::make_address_v4("93.184.216.34"), std::nullopt}});
        return std::make_shared<query_processor>(b);
    }

    struct identity_files
    {
        std::filesystem::path dir_ = std::filesystem::temp_directory_path() / "encdns-supervisor-test";
        std::string cert_ = (dir_ / "server.crt").string();
        std::string key_ = (dir_ / "server.key").string();

        identity_files()
        {
            std::filesystem::remove_all(dir_);
            save_identity(make_self_signed(), cert_, key_);
        }
        ~identity_files() { std::filesystem::remove_all(dir_); }
    };

    listener_config enabled(const identity_files &f)
    {
        return {.enabled_ = true, .port_ = 0, .cert_path_ = f.cert_, .key_path_ = f.key_};
    }

    using client_stream = ssl::stream<ip::tcp::socket>;

    std::unique_ptr<client_stream> connect(io_context &ioc, ssl::context &ctx, uint16_t port)
    {
        auto s = std::make_unique<client_stream>(ioc, ctx);
        s->lowest_layer().connect({ip::make_address("127.0.0.1"), port});
        s->handshake(ssl::stream_base::client);
        return s;
    }
}

TEST_CASE("disabled listeners stay down")
{
    io_context ioc;
    supervisor sv(ioc.get_executor(), processor());
    auto report = sv.start({});
    CHECK(report.doh_.state_ == start_state::disabled);
    CHECK(report.dot_.state_ == start_state::disabled);
    auto st = sv.status();
    CHECK_FALSE(st.doh_.running_);
    CHECK_FALSE(st.dot_.port_.has_value());
}

TEST_CASE("missing certificate skips the listener")
{
    io_context ioc;
    supervisor sv(ioc.get_executor(), processor());
    service_config sc;
    sc.dot_ = {.enabled_ = true, .port_ = 0, .cert_path_ = "/nonexistent/a.crt", .key_path_ = "/nonexistent/a.key"};
    auto report = sv.start(sc);
    CHECK(report.dot_.state_ == start_state::skipped);
    CHECK_FALSE(sv.status().dot_.running_);
}

TEST_CASE("one broken listener does not stop the other")
{
    identity_files f;
    auto bad_cert = (f.dir_ / "bad.crt").string();
    std::ofstream(bad_cert) << "garbage";

    io_context ioc;
    supervisor sv(ioc.get_executor(), processor());
    service_config sc;
    sc.doh_ = {.enabled_ = true, .port_ = 0, .cert_path_ = bad_cert, .key_path_ = f.key_};
    sc.dot_ = enabled(f);
    auto report = sv.start(sc);
    CHECK(report.doh_.state_ == start_state::failed);
    CHECK_FALSE(report.doh_.error_.empty());
    CHECK(report.dot_.state_ == start_state::started);

    auto st = sv.status();
    CHECK_FALSE(st.doh_.running_);
    CHECK(st.dot_.running_);
    CHECK(st.dot_.port_.value_or(0) != 0);

    SUBCASE("port already taken")
    {
        service_config again;
        again.doh_ = enabled(f);
        again.doh_.port_ = *st.dot_.port_;
        supervisor other(ioc.get_executor(), processor());
        CHECK(other.start(again).doh_.state_ == start_state::failed);
    }
    SUBCASE("invalid port")
    {
        service_config again;
        again.doh_ = enabled(f);
        again.doh_.port_ = 70000;
        supervisor other(ioc.get_executor(), processor());
        CHECK(other.start(again).doh_.state_ == start_state::failed);
    }

    sv.stop();
    sv.stop();
    CHECK_FALSE(sv.status().dot_.running_);
}

TEST_CASE("end to end over TLS")
{
    identity_files f;
    io_context ioc;
    supervisor sv(ioc.get_executor(), processor());
    service_config sc;
    sc.doh_ = enabled(f);
    sc.dot_ = enabled(f);
    auto report = sv.start(sc);
    REQUIRE(report.doh_.state_ == start_state::started);
    REQUIRE(report.dot_.state_ == start_state::started);
    auto st = sv.status();
    REQUIRE(st.doh_.port_);
    REQUIRE(st.dot_.port_);

    auto guard = make_work_guard(ioc);
    std::jthread server([&ioc]
                        { ioc.run(); });

    io_context cioc;
    ssl::context cctx(ssl::context::tls_client);
    cctx.set_verify_mode(ssl::verify_none);

    SUBCASE("DoT")
    {
        auto s = connect(cioc, cctx, *st.dot_.port_);
        for (uint16_t id : {1, 2})
        {
            asio::write(*s, buffer(stream_framer::frame(test::make_query(id, "example.com"))));
            std::array<unsigned char, 2> len{};
            asio::read(*s, buffer(len));
            std::string payload((len[0] << 8) | len[1], '\0');
            asio::read(*s, buffer(payload));

            auto m = decode_message(payload);
            CHECK(m.id == id);
            CHECK(m.rcode == NOERROR);
            REQUIRE(m.answers.size() == 1);
            CHECK(std::get<asio::ip::address_v4>(m.answers[0].data) == asio::ip::make_address_v4("93.184.216.34"));
        }
        asio::error_code ec;
        s->lowest_layer().close(ec);
    }
    SUBCASE("DoH")
    {
        auto s = connect(cioc, cctx, *st.doh_.port_);
        auto q = test::make_query(0x5151, "example.com");
        std::string req = "POST /dns-query HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/dns-message\r\n"
                          "Connection: close\r\nContent-Length: " +
                          std::to_string(q.size()) + "\r\n\r\n" + q;
        asio::write(*s, buffer(req));

        std::string resp;
        asio::error_code ec;
        asio::read(*s, dynamic_buffer(resp), ec);
        REQUIRE(resp.starts_with("HTTP/1.1 200 OK\r\n"));
        auto body = resp.substr(resp.find("\r\n\r\n") + 4);
        auto m = decode_message(body);
        CHECK(m.id == 0x5151);
        CHECK(m.answers.size() == 1);
    }

    sv.stop();
    CHECK_FALSE(sv.status().doh_.running_);
    CHECK_FALSE(sv.status().dot_.running_);

    // 停止之后不再接受连接,关闭在服务线程上执行
    CHECK(test::refused_soon(cioc, *st.dot_.port_));

    guard.reset();
    ioc.stop();
}
