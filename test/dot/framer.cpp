#include "dot/framer.h"

#include <doctest/doctest.h>

using namespace encdns;

TEST_CASE("frame prefixes the big-endian length")
{
    auto f = stream_framer::frame("abc");
    CHECK(f == std::string("\x00\x03" "abc", 5));
    CHECK(stream_framer::frame(std::string(300, 'x')).substr(0, 2) == std::string("\x01\x2c", 2));
    CHECK_THROWS_AS(stream_framer::frame(std::string(65536, 'x')), std::length_error);
}

TEST_CASE("messages split across chunks")
{
    stream_framer fr;
    CHECK(fr.current_state() == stream_framer::state::awaiting_length);

    fr.append(std::string("\x00", 1));
    CHECK_FALSE(fr.next());
    CHECK(fr.current_state() == stream_framer::state::awaiting_length);

    fr.append(std::string("\x05he", 3));
    CHECK_FALSE(fr.next());
    CHECK(fr.current_state() == stream_framer::state::awaiting_payload);

    fr.append("llo");
    auto m = fr.next();
    REQUIRE(m);
    CHECK(*m == "hello");
    CHECK(fr.buffered() == 0);
    CHECK(fr.current_state() == stream_framer::state::awaiting_length);
}

TEST_CASE("several messages in one chunk come out in order")
{
    stream_framer fr;
    fr.append(stream_framer::frame("one") + stream_framer::frame("") + stream_framer::frame("three") + std::string("\x00", 1));
    CHECK(fr.next() == "one");
    CHECK(fr.next() == "");
    CHECK(fr.next() == "three");
    CHECK_FALSE(fr.next());
    CHECK(fr.buffered() == 1);
}

TEST_CASE("buffer cap")
{
    stream_framer fr(16);
    fr.append(std::string(10, 'x'));
    CHECK_THROWS_AS(fr.append(std::string(7, 'x')), transport_error);

    stream_framer big;
    // 一个最大的帧正好能放下
    big.append(std::string("\xff\xff", 2) + std::string(65535, 'a'));
    auto m = big.next();
    REQUIRE(m);
    CHECK(m->size() == 65535);

    big.append(std::string(stream_framer::default_max_buffer, 'b'));
    CHECK_THROWS_AS(big.append("b"), transport_error);
}
