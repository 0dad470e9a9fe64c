#include "dot/dot_session.h"
#include "dot/framer.h"
#include "../test_util.h"

#include <doctest/doctest.h>

using namespace encdns;
using namespace encdns::net_headers;
using encdns::test::run;

namespace
{
    std::vector<dns_message> responses(const std::string &out)
    {
        stream_framer fr;
        fr.append(out);
        std::vector<dns_message> r;
        while (auto m = fr.next())
        {
            r.push_back(decode_message(*m));
        }
        CHECK(fr.buffered() == 0);
        return r;
    }

    std::shared_ptr<query_processor> processor()
    {
        auto b = std::make_shared<test::fake_backend>();
        b->results_["a.example"] = lookup_result::found({{asio::ip::make_address_v4("10.0.0.1"), std::nullopt}});
        b->results_["b.example"] = lookup_result::found({{asio::ip::make_address_v4("10.0.0.2"), std::nullopt}});
        return std::make_shared<query_processor>(b);
    }
}

TEST_CASE("queries on one connection are answered in order")
{
    auto in = stream_framer::frame(test::make_query(1, "a.example")) +
              stream_framer::frame(test::make_query(2, "missing.example")) +
              stream_framer::frame(test::make_query(3, "b.example"));

    // 分块边界落在长度前缀和消息中间
    for (std::size_t chunk : {1u, 2u, 7u, 1000u})
    {
        CAPTURE(chunk);
        auto mem = std::make_shared<test::scripted_mem>(test::split(in, chunk));
        run(serve_dot(mem, processor(), stream_framer::default_max_buffer));

        auto rs = responses(mem->out_);
        REQUIRE(rs.size() == 3);
        CHECK(rs[0].id == 1);
        CHECK(rs[0].answers.size() == 1);
        CHECK(rs[1].id == 2);
        CHECK(rs[1].rcode == NXDOMAIN);
        CHECK(rs[2].id == 3);
        CHECK(rs[2].rcode == NOERROR);
        CHECK(mem->closed_);
    }
}

TEST_CASE("a malformed message gets SERVFAIL and the connection goes on")
{
    auto in = stream_framer::frame(std::string("\x00\x2a\x01\x00", 4)) +
              stream_framer::frame(test::make_query(8, "a.example"));
    auto mem = std::make_shared<test::scripted_mem>(test::split(in, 5));
    run(serve_dot(mem, processor(), stream_framer::default_max_buffer));

    auto rs = responses(mem->out_);
    REQUIRE(rs.size() == 2);
    CHECK(rs[0].id == 42);
    CHECK(rs[0].rcode == SERVFAIL);
    CHECK(rs[1].id == 8);
    CHECK(rs[1].rcode == NOERROR);
}

TEST_CASE("buffer overflow closes the connection")
{
    // 宣告一个很长的帧,数据一直不完整
    std::string in = std::string("\xff\xff", 2) + std::string(200, 'x');
    auto mem = std::make_shared<test::scripted_mem>(test::split(in, 50));
    run(serve_dot(mem, processor(), 100));
    CHECK(mem->out_.empty());
    CHECK(mem->closed_);
}

TEST_CASE("partial frame at close is dropped")
{
    auto in = stream_framer::frame(test::make_query(4, "a.example"));
    auto mem = std::make_shared<test::scripted_mem>(std::deque<std::string>{in.substr(0, in.size() - 1)});
    run(serve_dot(mem, processor(), stream_framer::default_max_buffer));
    CHECK(mem->out_.empty());
}
