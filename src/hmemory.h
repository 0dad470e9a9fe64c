#ifndef SRC_HMEMORY
#define SRC_HMEMORY
#include <cstddef>
#include <string>
#include <string_view>
#include <memory>
#include <stdexcept>
#include <algorithm>

#include <asio/awaitable.hpp>
#include <asio/buffer.hpp>
#include <spdlog/spdlog.h>

namespace encdns
{
    using namespace asio;

    namespace log = spdlog;

    // 连接上的读写,读到的数据放到buff中,通过get_some remove_some 进行缓存读取和消耗
    // XXX 线程不安全,一个连接只在一个协程里用
    class memory
    {
    public:
        // XXX读取最大max_n的数据,放到buff中.返回本次读到的部分,下次加载之前有效
        virtual awaitable<std::string_view> async_load_some(std::size_t max_n = 1024 * 4)
        {
            compact();
            auto begin = buff_.size();
            buff_.resize(begin + max_n);
            auto n = co_await async_read_raw(buffer(buff_.data() + begin, max_n));
            buff_.resize(begin + n);
            if (n == 0)
            {
                read_ok_ = false;
                co_return "";
            }
            co_return std::string_view(buff_.data() + begin, n);
        }

        // XXX 读直到.返回从缓存开头到分隔符结尾的字符串,数据仍留在buff中
        //  对端关闭时返回空,超过max_n抛出std::length_error
        virtual awaitable<std::string_view> async_load_until(const std::string &d, std::size_t max_n = 1024 * 16)
        {
            std::size_t from = 0;
            while (true)
            {
                auto some = get_some();
                if (auto p = some.find(d, from); p != std::string_view::npos)
                {
                    co_return some.substr(0, p + d.size());
                }
                if (some.size() >= max_n)
                {
                    throw std::length_error("async_load_until: 超过最大长度");
                }
                from = some.size() >= d.size() ? some.size() - d.size() + 1 : 0;
                if ((co_await async_load_some()).empty())
                {
                    co_return "";
                }
            }
        }

        virtual awaitable<void> async_write_all(std::string_view) = 0;

        virtual std::string_view get_some() { return std::string_view(buff_).substr(read_index_); }
        virtual std::size_t remove_some(std::size_t n)
        {
            read_index_ = std::min(read_index_ + n, buff_.size());
            return buff_.size() - read_index_;
        }

        // 读写状态是否合法
        virtual bool ok() { return read_ok_ && write_ok_; }
        virtual void close() {}

    public:
        virtual ~memory() = default;

    protected:
        /// @return 0 表示对端关闭或出错
        virtual awaitable<std::size_t> async_read_raw(mutable_buffer b) = 0;

        void compact()
        {
            if (read_index_ > 0)
            {
                buff_.erase(0, read_index_);
                read_index_ = 0;
            }
        }

    protected:
        bool read_ok_ = true;
        bool write_ok_ = true;

        std::string buff_;
        std::size_t read_index_ = 0;
    };

} // namespace encdns

#endif /* SRC_HMEMORY */
