#include "dns/host_table.h"
#include "config.h"
#include "../test_util.h"

#include <doctest/doctest.h>

using namespace encdns;
using encdns::test::run;

TEST_CASE("host_table answers configured records case-insensitively")
{
    host_table ht;
    ht.load_hm({
        {.host_ = "Router.LAN", .type_ = "A", .values_ = {"192.168.1.1", "192.168.1.2"}},
        {.host_ = "router.lan", .type_ = "AAAA", .values_ = {"fd00::1"}, .ttl_ = 30},
        {.host_ = "lan", .type_ = "MX", .values_ = {"10 mail.lan"}},
        {.host_ = "lan", .type_ = "txt", .values_ = {"hello"}},
    });
    CHECK(ht.size() == 2);

    auto a = run(ht.lookup("ROUTER.lan.", qtype_kind::A));
    CHECK(a.status_ == lookup_status::ok);
    REQUIRE(a.answers_.size() == 2);
    CHECK_FALSE(a.answers_[0].ttl.has_value());

    auto aaaa = run(ht.lookup("router.lan", qtype_kind::AAAA));
    REQUIRE(aaaa.answers_.size() == 1);
    CHECK(aaaa.answers_[0].ttl == 30u);

    auto mx = run(ht.lookup("lan", qtype_kind::MX));
    REQUIRE(mx.answers_.size() == 1);
    mx_data expect{10, "mail.lan"};
    CHECK(std::get<mx_data>(mx.answers_[0].data) == expect);

    // 名字存在但没有这个类型
    auto cname = run(ht.lookup("lan", qtype_kind::CNAME));
    CHECK(cname.status_ == lookup_status::ok);
    CHECK(cname.answers_.empty());

    CHECK(run(ht.lookup("unknown.lan", qtype_kind::A)).status_ == lookup_status::not_found);
}

TEST_CASE("host_table falls through to the next backend")
{
    auto next = std::make_shared<test::fake_backend>();
    next->results_["example.com"] = lookup_result::found({{asio::ip::make_address_v4("1.2.3.4"), std::nullopt}});

    host_table ht(next);
    ht.add("local.test", qtype_kind::A, asio::ip::make_address_v4("127.0.0.1"));

    auto local = run(ht.lookup("local.test", qtype_kind::A));
    REQUIRE(local.answers_.size() == 1);
    CHECK(next->calls_.empty());

    // 本地有名字但没有AAAA,交给下一个
    run(ht.lookup("local.test", qtype_kind::AAAA));
    CHECK(next->calls_.size() == 1);

    auto remote = run(ht.lookup("example.com", qtype_kind::A));
    CHECK(remote.status_ == lookup_status::ok);
    CHECK(remote.answers_.size() == 1);
}

TEST_CASE("bad host_mapping values are rejected")
{
    host_table ht;
    CHECK_THROWS_AS(ht.load_hm({{.host_ = "x", .type_ = "A", .values_ = {"not-an-ip"}}}), std::invalid_argument);
    CHECK_THROWS_AS(ht.load_hm({{.host_ = "x", .type_ = "AAAA", .values_ = {"1.2.3.4"}}}), std::invalid_argument);
    CHECK_THROWS_AS(ht.load_hm({{.host_ = "x", .type_ = "MX", .values_ = {"mail.x"}}}), std::invalid_argument);
    CHECK_THROWS_AS(ht.load_hm({{.host_ = "x", .type_ = "SRV", .values_ = {"whatever"}}}), std::invalid_argument);
    CHECK_THROWS_AS(ht.load_hm({{.host_ = "", .type_ = "A", .values_ = {"1.2.3.4"}}}), std::invalid_argument);
}
