#ifndef SRC_DOH_DOH_HANDLER
#define SRC_DOH_DOH_HANDLER

#include "hmemory.h"
#include "dns/resolver.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <optional>
#include <memory>

namespace encdns
{
    // 键是小写的
    using http_headers = std::unordered_map<std::string, std::string>;

    struct http_request
    {
        std::string method_;
        std::string target_;
        std::string path_;
        std::string query_;
        std::string version_;
        http_headers headers_;
        std::string body_;

        bool keep_alive() const;
    };

    struct http_response
    {
        int status_ = 200;
        std::vector<std::pair<std::string, std::string>> headers_;
        std::string body_;

        static http_response make(int status, std::string body = {}, std::string content_type = "text/plain");

        // 自动加上Content-Length
        std::string to_string() const;
    };

    // https://www.rfc-editor.org/rfc/rfc9112#section-3
    /// @param head 请求行和所有头部,以\r\n\r\n结尾
    std::optional<http_request> parser_request_head(std::string_view head);

    // https://www.rfc-editor.org/rfc/rfc2616#section-4.2
    bool parser_header(std::string_view svl, http_headers &h);

    std::optional<std::string> query_param(std::string_view query, std::string_view name);

    // https://www.rfc-editor.org/rfc/rfc4648#section-5 不合法返回nullopt
    std::optional<std::string> b64url_decode(std::string_view in);

    std::optional<std::size_t> msg_body_size(const http_headers &header);

    // https://www.rfc-editor.org/rfc/rfc8484
    class doh_handler
    {
    public:
        static constexpr std::size_t max_body = 65535;
        static constexpr std::string_view path = "/dns-query";

        explicit doh_handler(std::shared_ptr<query_processor> qp);

        /// @brief 已经读完body的请求 -> 响应
        awaitable<http_response> handle(http_request req);

        /// @brief 一个连接上的http/1.1请求,默认keep-alive
        awaitable<void> serve(std::shared_ptr<memory> mem);

    private:
        std::shared_ptr<query_processor> qp_;
    };

} // namespace encdns

#endif /* SRC_DOH_DOH_HANDLER */
