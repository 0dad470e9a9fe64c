#ifndef SRC_DOT_DOT_SESSION
#define SRC_DOT_DOT_SESSION

#include "hmemory.h"
#include "dns/resolver.h"

namespace encdns
{
    /// @brief 一个DoT连接上的所有查询,按顺序处理并按顺序回复
    /// https://www.rfc-editor.org/rfc/rfc7858#section-3.3
    /// @param mem 已完成tls握手的连接
    awaitable<void> serve_dot(std::shared_ptr<memory> mem, std::shared_ptr<query_processor> qp, std::size_t max_buffer);

} // namespace encdns

#endif /* SRC_DOT_DOT_SESSION */
