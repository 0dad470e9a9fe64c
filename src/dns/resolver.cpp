#include "resolver.h"

#include <variant>

#include <asio/experimental/awaitable_operators.hpp>

#include <spdlog/spdlog.h>

using namespace asio::experimental::awaitable_operators;

namespace encdns
{
    using namespace net_headers;

    dns_message make_response(const dns_message &query, uint8_t rcode)
    {
        dns_message r;
        r.id = query.id;
        r.is_response = true;
        r.opcode = query.opcode;
        r.recursion_desired = true;
        r.recursion_available = true;
        r.rcode = rcode;
        r.questions = query.questions;
        return r;
    }

    std::string servfail_response(uint16_t id)
    {
        dns_message r;
        r.id = id;
        r.is_response = true;
        r.rcode = SERVFAIL;
        return encode_message(r);
    }

    query_processor::query_processor(std::shared_ptr<resolver_backend> backend, std::chrono::milliseconds timeout)
        : backend_(std::move(backend)), timeout_(timeout)
    {
        if (!backend_)
        {
            throw std::invalid_argument("query_processor: backend is null");
        }
    }

    awaitable<std::string> query_processor::process(std::string wire)
    {
        dns_message query;
        try
        {
            query = decode_message(wire);
        }
        catch (const decode_error &e)
        {
            // 解码失败时只能从前2字节恢复id,恢复不了才用0
            auto id = peek_id(wire).value_or(0);
            log::warn("query_processor::process: 查询解码失败 id={} {}", id, e.what());
            co_return servfail_response(id);
        }

        dns_message response;
        try
        {
            response = co_await respond(query);
            co_return encode_message(response);
        }
        catch (const std::exception &e)
        {
            log::error("query_processor::process: id={} {}", query.id, e.what());
        }
        try
        {
            co_return encode_message(make_response(query, SERVFAIL));
        }
        catch (const encode_error &e)
        {
            log::error("query_processor::process: id={} 问题部分无法编码 {}", query.id, e.what());
        }
        co_return servfail_response(query.id);
    }

    awaitable<dns_message> query_processor::respond(dns_message query)
    {
        if (query.opcode != QUERY)
        {
            log::debug("query_processor::respond: 不支持的opcode {}", query.opcode);
            co_return make_response(query, NOTIMP);
        }

        auto response = make_response(query, NOERROR);
        for (auto &&q : query.questions)
        {
            if (q.qclass != IN || q.kind() == qtype_kind::unsupported)
            {
                log::debug("query_processor::respond: 跳过 {} {} class={}", q.name, type_name(q.type), q.qclass);
                continue;
            }

            auto result = co_await resolve(q);
            if (result.status_ == lookup_status::not_found)
            {
                response.rcode = NXDOMAIN;
                response.answers.clear();
                break;
            }
            if (result.status_ == lookup_status::failure)
            {
                log::error("query_processor::respond: 解析 {} {} 失败 {}", q.name, type_name(q.type), result.error_);
                response.rcode = SERVFAIL;
                response.answers.clear();
                break;
            }

            for (auto &&a : result.answers_)
            {
                response.answers.push_back(dns_record{q.name, q.type, IN, a.ttl.value_or(default_ttl), std::move(a.data)});
            }
        }
        co_return response;
    }

    awaitable<lookup_result> query_processor::resolve(dns_question q)
    {
        if (timeout_.count() <= 0)
        {
            co_return co_await backend_->lookup(q.name, q.kind());
        }

        steady_timer_a t(co_await this_coro::executor);
        t.expires_after(timeout_);

        std::variant<lookup_result, std::monostate> r = co_await (backend_->lookup(q.name, q.kind()) || t.async_wait());
        if (r.index() != 0)
        {
            log::warn("query_processor::resolve: {} {} 超时 {}ms", q.name, type_name(q.type), timeout_.count());
            co_return lookup_result::failure("resolve timeout");
        }
        co_return std::get<0>(std::move(r));
    }

} // namespace encdns
