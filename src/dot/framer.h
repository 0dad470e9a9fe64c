#ifndef SRC_DOT_FRAMER
#define SRC_DOT_FRAMER

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>

namespace encdns
{
    // 连接级别的错误,只关闭当前连接
    class transport_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // https://www.rfc-editor.org/rfc/rfc7858#section-3.3
    // 2字节大端长度 + dns消息,请求和响应都一样
    class stream_framer
    {
    public:
        enum class state
        {
            awaiting_length,
            awaiting_payload
        };

        static constexpr std::size_t max_frame = 2 + 65535;
        static constexpr std::size_t default_max_buffer = 4 * max_frame;

        explicit stream_framer(std::size_t max_buffer = default_max_buffer);

        /// @brief 追加收到的数据.缓存超过上限时抛出transport_error
        void append(std::string_view chunk);

        /// @brief 取出下一个完整的消息(不含长度前缀),数据不够时返回nullopt
        std::optional<std::string> next();

        state current_state() const;
        std::size_t buffered() const { return buffer_.size() - read_index_; }

        static std::string frame(std::string_view msg);

    private:
        void compact();

        std::string buffer_;
        std::size_t read_index_ = 0;
        std::size_t max_buffer_;
    };

} // namespace encdns

#endif /* SRC_DOT_FRAMER */
