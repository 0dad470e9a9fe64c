#include "dot_session.h"
#include "dot/framer.h"

#include <spdlog/spdlog.h>

namespace encdns
{
    awaitable<void> serve_dot(std::shared_ptr<memory> mem, std::shared_ptr<query_processor> qp, std::size_t max_buffer)
    {
        stream_framer framer(max_buffer);
        std::size_t n = 0;

        while (mem->ok())
        {
            if ((co_await mem->async_load_some()).empty())
            {
                break;
            }
            auto some = mem->get_some();
            try
            {
                framer.append(some);
            }
            catch (const transport_error &e)
            {
                log::warn("serve_dot: {} 关闭连接", e.what());
                break;
            }
            mem->remove_some(some.size());

            while (auto msg = framer.next())
            {
                std::string resp;
                try
                {
                    resp = co_await qp->process(*msg);
                }
                catch (const std::exception &e)
                {
                    log::error("serve_dot: {}", e.what());
                    resp = servfail_response(peek_id(*msg).value_or(0));
                }
                co_await mem->async_write_all(stream_framer::frame(resp));
                n++;
            }
        }
        if (framer.buffered() > 0)
        {
            log::debug("serve_dot: 连接关闭时丢弃不完整的帧 {} 字节", framer.buffered());
        }
        log::debug("serve_dot: 连接结束,处理查询 {} 个", n);
        mem->close();
    }

} // namespace encdns
