#include "doh_handler.h"

#include <regex>
#include <cctype>

#include <openssl/evp.h>

#include <spdlog/spdlog.h>

namespace encdns
{
    namespace
    {
        std::string_view reason(int status)
        {
            switch (status)
            {
            case 200:
                return "OK";
            case 400:
                return "Bad Request";
            case 404:
                return "Not Found";
            case 411:
                return "Length Required";
            case 413:
                return "Payload Too Large";
            case 500:
                return "Internal Server Error";
            default:
                return "Unknown";
            }
        }

        std::string_view trim(std::string_view s)
        {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
                s.remove_suffix(1);
            return s;
        }

        http_response bad_request(std::string why)
        {
            auto r = http_response::make(400, std::move(why));
            r.headers_.emplace_back("Connection", "close");
            return r;
        }
    }

    bool http_request::keep_alive() const
    {
        auto c = headers_.find("connection");
        if (c != headers_.end())
        {
            auto v = to_lower(c->second);
            if (v == "close")
                return false;
            if (v == "keep-alive")
                return true;
        }
        // http/1.0默认关闭
        return version_ != "HTTP/1.0";
    }

    http_response http_response::make(int status, std::string body, std::string content_type)
    {
        http_response r;
        r.status_ = status;
        r.body_ = std::move(body);
        r.headers_.emplace_back("Content-Type", std::move(content_type));
        return r;
    }

    std::string http_response::to_string() const
    {
        std::string s = "HTTP/1.1 " + std::to_string(status_) + " " + std::string(reason(status_)) + "\r\n";
        for (auto &&[k, v] : headers_)
        {
            s += k + ": " + v + "\r\n";
        }
        s += "Content-Length: " + std::to_string(body_.size()) + "\r\n\r\n";
        s += body_;
        return s;
    }

    std::optional<http_request> parser_request_head(std::string_view head)
    {
        auto line_end = head.find("\r\n");
        if (line_end == std::string_view::npos)
        {
            return std::nullopt;
        }
        auto svl = head.substr(0, line_end);
        http_request h;

        // method
        auto method_end = svl.find(' ');
        if (method_end == std::string_view::npos || method_end == 0)
        {
            return std::nullopt;
        }
        h.method_ = svl.substr(0, method_end);
        svl.remove_prefix(method_end + 1);

        // 只接受origin-form
        auto uri_end = svl.find(' ');
        if (uri_end == std::string_view::npos || !svl.starts_with('/'))
        {
            return std::nullopt;
        }
        h.target_ = svl.substr(0, uri_end);
        svl.remove_prefix(uri_end + 1);
        if (auto q = h.target_.find('?'); q != std::string::npos)
        {
            h.path_ = h.target_.substr(0, q);
            h.query_ = h.target_.substr(q + 1);
        }
        else
        {
            h.path_ = h.target_;
        }

        // 检查http协议版本
        static const std::regex ver(R"(^HTTP/1\.[01]$)");
        if (!std::regex_match(svl.begin(), svl.end(), ver))
        {
            log::debug("parser_request_head: 不支持的协议版本 {}", svl);
            return std::nullopt;
        }
        h.version_ = svl;

        // 头部部分包含最后的\r\n,空行之前
        auto headers = head.substr(line_end + 2);
        if (headers.ends_with("\r\n"))
        {
            headers.remove_suffix(2);
        }
        if (!parser_header(headers, h.headers_))
        {
            return std::nullopt;
        }
        return h;
    }

    bool parser_header(std::string_view svl, http_headers &h)
    {
        // Host: server.example.com
        while (svl.size() > 0)
        {
            auto val_end = svl.find("\r\n");
            if (val_end == std::string_view::npos)
            {
                return false;
            }
            auto line = svl.substr(0, val_end);
            svl.remove_prefix(val_end + 2);

            auto name_end = line.find(':');
            if (name_end == std::string_view::npos || name_end == 0)
            {
                return false;
            }
            std::string val{trim(line.substr(name_end + 1))};
            // 如果可能的结束点跟随" ",则它不是真正的结束点
            while (svl.starts_with(" ") || svl.starts_with("\t"))
            {
                auto e = svl.find("\r\n");
                if (e == std::string_view::npos)
                {
                    return false;
                }
                val += " ";
                val += trim(svl.substr(0, e));
                svl.remove_prefix(e + 2);
            }
            // normalize成一般形式,易于比较
            auto name = to_lower(line.substr(0, name_end));
            if (auto old = h.find(name); old != h.end())
            {
                old->second += ", " + val;
            }
            else
            {
                h.emplace(std::move(name), std::move(val));
            }
        }
        return true;
    }

    std::optional<std::string> query_param(std::string_view query, std::string_view name)
    {
        while (!query.empty())
        {
            auto amp = query.find('&');
            auto kv = query.substr(0, amp);
            auto eq = kv.find('=');
            if (kv.substr(0, eq) == name)
            {
                return eq == std::string_view::npos ? std::string{} : std::string{kv.substr(eq + 1)};
            }
            if (amp == std::string_view::npos)
                break;
            query.remove_prefix(amp + 1);
        }
        return std::nullopt;
    }

    std::optional<std::string> b64url_decode(std::string_view in)
    {
        // 允许带padding
        while (in.ends_with('=') || in.ends_with("%3D") || in.ends_with("%3d"))
        {
            in.remove_suffix(in.ends_with('=') ? 1 : 3);
        }
        if (in.size() % 4 == 1)
        {
            return std::nullopt;
        }

        std::string b64;
        b64.reserve(in.size() + 3);
        for (auto c : in)
        {
            if (c == '-')
                b64 += '+';
            else if (c == '_')
                b64 += '/';
            else if (std::isalnum(static_cast<unsigned char>(c)))
                b64 += c;
            else
                return std::nullopt;
        }
        auto pad = (4 - b64.size() % 4) % 4;
        b64.append(pad, '=');

        std::string out(b64.size() / 4 * 3, '\0');
        auto n = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                 reinterpret_cast<const unsigned char *>(b64.data()),
                                 static_cast<int>(b64.size()));
        if (n < 0)
        {
            return std::nullopt;
        }
        // EVP_DecodeBlock不去掉padding对应的字节
        out.resize(static_cast<std::size_t>(n) - pad);
        return out;
    }

    // 没有Content-Length时body为空,不合法返回nullopt
    std::optional<std::size_t> msg_body_size(const http_headers &header)
    {
        auto cl = header.find("content-length");
        if (cl == header.end())
        {
            return 0;
        }
        static const std::regex digit(R"(^(0|[1-9]\d{0,10})$)");
        std::smatch m;
        if (!std::regex_match(cl->second, m, digit))
        {
            log::info("msg_body_size: Content-Length字段不合法 {}", cl->second);
            return std::nullopt;
        }
        return std::stoull(m[1].str());
    }

    doh_handler::doh_handler(std::shared_ptr<query_processor> qp) : qp_(std::move(qp))
    {
        if (!qp_)
        {
            throw std::invalid_argument("doh_handler: query_processor is null");
        }
    }

    awaitable<http_response> doh_handler::handle(http_request req)
    {
        if (req.path_ != path)
        {
            co_return http_response::make(404, "not found");
        }

        std::string wire;
        if (req.method_ == "GET")
        {
            auto dns = query_param(req.query_, "dns");
            if (!dns)
            {
                co_return http_response::make(400, "missing dns parameter");
            }
            auto decoded = b64url_decode(*dns);
            if (!decoded)
            {
                co_return http_response::make(400, "invalid dns parameter");
            }
            wire = std::move(*decoded);
        }
        else if (req.method_ == "POST")
        {
            wire = std::move(req.body_);
        }
        else
        {
            co_return http_response::make(404, "not found");
        }

        std::string answer;
        try
        {
            answer = co_await qp_->process(std::move(wire));
        }
        catch (const std::exception &e)
        {
            log::error("doh_handler::handle: {}", e.what());
            co_return http_response::make(500, "internal server error");
        }

        auto r = http_response::make(200, std::move(answer), "application/dns-message");
        r.headers_.emplace_back("Access-Control-Allow-Origin", "*");
        r.headers_.emplace_back("Access-Control-Allow-Methods", "GET, POST");
        r.headers_.emplace_back("Access-Control-Allow-Headers", "Content-Type");
        co_return r;
    }

    awaitable<void> doh_handler::serve(std::shared_ptr<memory> mem)
    {
        while (mem->ok())
        {
            std::optional<http_request> req;
            try
            {
                auto head = co_await mem->async_load_until("\r\n\r\n");
                if (head.empty())
                {
                    break;
                }
                req = parser_request_head(head);
                mem->remove_some(head.size());
            }
            catch (const std::length_error &e)
            {
                log::debug("doh_handler::serve: {}", e.what());
            }

            if (!req)
            {
                co_await mem->async_write_all(bad_request("malformed request").to_string());
                break;
            }

            if (req->headers_.contains("transfer-encoding"))
            {
                auto r = http_response::make(411, "chunked body is not supported");
                r.headers_.emplace_back("Connection", "close");
                co_await mem->async_write_all(r.to_string());
                break;
            }
            auto body_size = msg_body_size(req->headers_);
            if (!body_size)
            {
                co_await mem->async_write_all(bad_request("invalid content-length").to_string());
                break;
            }
            if (*body_size > max_body)
            {
                auto r = http_response::make(413, "body too large");
                r.headers_.emplace_back("Connection", "close");
                co_await mem->async_write_all(r.to_string());
                break;
            }

            while (mem->get_some().size() < *body_size)
            {
                if ((co_await mem->async_load_some()).empty())
                {
                    break;
                }
            }
            if (mem->get_some().size() < *body_size)
            {
                log::debug("doh_handler::serve: body不完整,连接已关闭");
                break;
            }
            req->body_ = mem->get_some().substr(0, *body_size);
            mem->remove_some(*body_size);

            auto keep = req->keep_alive();
            log::debug("doh_handler::serve: {} {}", req->method_, req->target_);
            auto resp = co_await handle(std::move(*req));
            if (!keep)
            {
                resp.headers_.emplace_back("Connection", "close");
            }
            co_await mem->async_write_all(resp.to_string());
            if (!keep)
            {
                break;
            }
        }
        mem->close();
    }

} // namespace encdns
