#ifndef SRC_DNS_HOST_TABLE
#define SRC_DNS_HOST_TABLE

#include "dns/resolver.h"

#include <unordered_map>
#include <vector>
#include <memory>

namespace encdns
{
    struct host_record;

    // 本地静态记录,查不到的交给next_
    class host_table : public resolver_backend
    {
    public:
        explicit host_table(std::shared_ptr<resolver_backend> next = nullptr);

        awaitable<lookup_result> lookup(std::string name, qtype_kind kind) override;

        /// @brief 加载配置里的host mapping,值不合法时抛出std::invalid_argument
        void load_hm(const std::vector<host_record> &hm);

        void add(std::string_view host, qtype_kind kind, rdata data, std::optional<uint32_t> ttl = std::nullopt);

        std::size_t size() const { return table_.size(); }

    private:
        struct entry
        {
            qtype_kind kind_;
            lookup_answer answer_;
        };

        std::unordered_map<std::string, std::vector<entry>> table_;
        std::shared_ptr<resolver_backend> next_;
    };

} // namespace encdns

#endif /* SRC_DNS_HOST_TABLE */
