#ifndef TEST_TEST_UTIL
#define TEST_TEST_UTIL

#include "hmemory.h"
#include "dns/resolver.h"

#include <deque>
#include <functional>
#include <future>
#include <map>
#include <thread>

#include <asio/io_context.hpp>
#include <asio/co_spawn.hpp>
#include <asio/use_future.hpp>

namespace encdns::test
{
    // 在本地io_context上跑完一个协程
    template <typename T>
    T run(awaitable<T> a)
    {
        io_context ioc;
        auto f = co_spawn(ioc, std::move(a), use_future);
        ioc.run();
        return f.get();
    }

    // 按给定的分块回放输入,记录所有输出
    class scripted_mem : public memory
    {
    public:
        explicit scripted_mem(std::deque<std::string> chunks) : chunks_(std::move(chunks)) {}

        awaitable<void> async_write_all(std::string_view s) override
        {
            out_ += s;
            co_return;
        }

        void close() override
        {
            closed_ = true;
            read_ok_ = write_ok_ = false;
        }

        std::string out_;
        bool closed_ = false;

    protected:
        awaitable<std::size_t> async_read_raw(mutable_buffer b) override
        {
            if (chunks_.empty())
            {
                co_return 0;
            }
            auto &c = chunks_.front();
            auto n = buffer_copy(b, buffer(c));
            c.erase(0, n);
            if (c.empty())
            {
                chunks_.pop_front();
            }
            co_return n;
        }

    private:
        std::deque<std::string> chunks_;
    };

    // 把字符串按固定大小切开
    inline std::deque<std::string> split(std::string_view s, std::size_t n)
    {
        std::deque<std::string> r;
        while (!s.empty())
        {
            r.emplace_back(s.substr(0, n));
            s.remove_prefix(std::min(n, s.size()));
        }
        return r;
    }

    // 记录查询,按名字返回预设结果
    class fake_backend : public resolver_backend
    {
    public:
        awaitable<lookup_result> lookup(std::string name, qtype_kind kind) override
        {
            calls_.emplace_back(name, kind);
            if (throws_)
            {
                throw std::runtime_error("backend exploded");
            }
            auto i = results_.find(name);
            if (i == results_.end())
            {
                co_return lookup_result::not_found();
            }
            co_return i->second;
        }

        std::map<std::string, lookup_result> results_;
        std::vector<std::pair<std::string, qtype_kind>> calls_;
        bool throws_ = false;
    };

    // 永远不返回,用来测试超时
    class hanging_backend : public resolver_backend
    {
    public:
        awaitable<lookup_result> lookup(std::string, qtype_kind) override
        {
            steady_timer_a t(co_await this_coro::executor);
            t.expires_after(std::chrono::hours(1));
            co_await t.async_wait();
            co_return lookup_result::not_found();
        }
    };

    // 端口在2秒内开始拒绝连接
    inline bool refused_soon(io_context &ioc, uint16_t port)
    {
        for (int i = 0; i < 100; i++)
        {
            ip::tcp::socket s(ioc);
            asio::error_code ec;
            s.connect({ip::make_address("127.0.0.1"), port}, ec);
            if (ec)
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }

    inline std::string make_query(uint16_t id, std::string name, uint16_t type = net_headers::A)
    {
        dns_message q;
        q.id = id;
        q.recursion_desired = true;
        q.questions.push_back({std::move(name), type, net_headers::IN});
        return encode_message(q);
    }

} // namespace encdns::test

#endif /* TEST_TEST_UTIL */
