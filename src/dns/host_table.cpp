#include "host_table.h"
#include "config.h"

#include <charconv>

#include <spdlog/spdlog.h>

namespace encdns
{
    namespace
    {
        std::string table_key(std::string_view host)
        {
            if (host.ends_with('.'))
                host.remove_suffix(1);
            return to_lower(host);
        }

        qtype_kind parse_kind(std::string_view type)
        {
            auto t = to_lower(type);
            if (t == "a")
                return qtype_kind::A;
            if (t == "aaaa")
                return qtype_kind::AAAA;
            if (t == "cname")
                return qtype_kind::CNAME;
            if (t == "mx")
                return qtype_kind::MX;
            if (t == "txt")
                return qtype_kind::TXT;
            throw std::invalid_argument("unsupported host_mapping type: " + std::string(type));
        }

        rdata parse_value(qtype_kind kind, const std::string &value)
        {
            asio::error_code ec;
            switch (kind)
            {
            case qtype_kind::A:
            {
                auto a = asio::ip::make_address_v4(value, ec);
                if (ec)
                    throw std::invalid_argument("invalid IPv4 address: " + value);
                return a;
            }
            case qtype_kind::AAAA:
            {
                auto a = asio::ip::make_address_v6(value, ec);
                if (ec)
                    throw std::invalid_argument("invalid IPv6 address: " + value);
                return a;
            }
            case qtype_kind::CNAME:
                return domain_name{value};
            case qtype_kind::MX:
            {
                // "10 mail.example.com"
                auto sp = value.find(' ');
                if (sp == std::string::npos)
                    throw std::invalid_argument("MX value needs '<preference> <exchange>': " + value);
                mx_data mx;
                auto [p, e] = std::from_chars(value.data(), value.data() + sp, mx.preference);
                if (e != std::errc{} || p != value.data() + sp)
                    throw std::invalid_argument("invalid MX preference: " + value);
                auto ex = value.find_first_not_of(' ', sp);
                if (ex == std::string::npos)
                    throw std::invalid_argument("MX value without exchange: " + value);
                mx.exchange = value.substr(ex);
                return mx;
            }
            case qtype_kind::TXT:
                return txt_data{{value}};
            default:
                throw std::invalid_argument("unsupported host_mapping value");
            }
        }
    }

    host_table::host_table(std::shared_ptr<resolver_backend> next) : next_(std::move(next))
    {
    }

    awaitable<lookup_result> host_table::lookup(std::string name, qtype_kind kind)
    {
        auto hm = table_.find(table_key(name));
        if (hm != table_.end())
        {
            std::vector<lookup_answer> answers;
            for (auto &&e : hm->second)
            {
                if (e.kind_ == kind)
                {
                    answers.push_back(e.answer_);
                }
            }
            if (!answers.empty() || !next_)
            {
                co_return lookup_result::found(std::move(answers));
            }
        }
        if (next_)
        {
            co_return co_await next_->lookup(std::move(name), kind);
        }
        co_return lookup_result::not_found();
    }

    void host_table::load_hm(const std::vector<host_record> &hm)
    {
        std::size_t n = 0;
        for (auto &&i : hm)
        {
            if (i.host_.empty())
            {
                throw std::invalid_argument("host_mapping entry without host_");
            }
            auto kind = parse_kind(i.type_);
            std::optional<uint32_t> ttl;
            if (i.ttl_ > 0)
            {
                ttl = static_cast<uint32_t>(i.ttl_);
            }
            for (auto &&v : i.values_)
            {
                add(i.host_, kind, parse_value(kind, v), ttl);
                n++;
            }
        }
        log::info("host_table::load_hm: 加载host mapping {} 条", n);
    }

    void host_table::add(std::string_view host, qtype_kind kind, rdata data, std::optional<uint32_t> ttl)
    {
        table_[table_key(host)].push_back({kind, {std::move(data), ttl}});
    }

} // namespace encdns
