#include "framer.h"

namespace encdns
{
    stream_framer::stream_framer(std::size_t max_buffer) : max_buffer_(max_buffer)
    {
    }

    void stream_framer::append(std::string_view chunk)
    {
        if (buffered() + chunk.size() > max_buffer_)
        {
            throw transport_error("dot frame buffer exceeds " + std::to_string(max_buffer_) + " bytes");
        }
        compact();
        buffer_.append(chunk);
    }

    std::optional<std::string> stream_framer::next()
    {
        if (buffered() < 2)
        {
            return std::nullopt;
        }
        std::size_t length = (static_cast<unsigned char>(buffer_[read_index_]) << 8) | static_cast<unsigned char>(buffer_[read_index_ + 1]);
        if (buffered() < 2 + length)
        {
            return std::nullopt;
        }
        std::string payload = buffer_.substr(read_index_ + 2, length);
        read_index_ += 2 + length;
        if (read_index_ == buffer_.size())
        {
            buffer_.clear();
            read_index_ = 0;
        }
        return payload;
    }

    stream_framer::state stream_framer::current_state() const
    {
        return buffered() < 2 ? state::awaiting_length : state::awaiting_payload;
    }

    std::string stream_framer::frame(std::string_view msg)
    {
        if (msg.size() > 0xffff)
        {
            throw std::length_error("dns message too long for length prefix");
        }
        std::string r;
        r.reserve(msg.size() + 2);
        r += static_cast<char>(msg.size() >> 8);
        r += static_cast<char>(msg.size() & 0xff);
        r.append(msg);
        return r;
    }

    // 已消费的部分在追加前移走,避免缓存一直增长
    void stream_framer::compact()
    {
        if (read_index_ > 0)
        {
            buffer_.erase(0, read_index_);
            read_index_ = 0;
        }
    }

} // namespace encdns
