#include "wire.h"

#include <algorithm>
#include <cctype>

namespace encdns
{
    using namespace net_headers;

    namespace
    {
        class wire_reader
        {
        public:
            explicit wire_reader(std::string_view buf) : buf_(buf) {}

            std::size_t pos() const { return pos_; }
            std::size_t remain() const { return buf_.size() - pos_; }

            uint8_t u8()
            {
                need(pos_, 1, "u8");
                return static_cast<uint8_t>(buf_[pos_++]);
            }

            uint16_t u16()
            {
                need(pos_, 2, "u16");
                uint16_t v = (byte_at(pos_) << 8) | byte_at(pos_ + 1);
                pos_ += 2;
                return v;
            }

            uint32_t u32()
            {
                uint32_t hi = u16();
                return (hi << 16) | u16();
            }

            std::string_view bytes(std::size_t n)
            {
                need(pos_, n, "bytes");
                auto r = buf_.substr(pos_, n);
                pos_ += n;
                return r;
            }

            // https://www.rfc-editor.org/rfc/rfc1035#section-4.1.4
            // 压缩指针只能指向当前位置之前,跳转次数有上限,否则就是畸形消息
            std::string name()
            {
                std::string out;
                std::size_t p = pos_;
                std::size_t wire_len = 0;
                bool jumped = false;
                int hops = 0;

                for (;;)
                {
                    need(p, 1, "label");
                    uint8_t len = byte_at(p);
                    if ((len & compress_mask) == compress_mask)
                    {
                        need(p, 2, "pointer");
                        std::size_t target = ((len & ~compress_mask) << 8) | byte_at(p + 1);
                        if (target >= p)
                            throw decode_error("compression pointer does not point backwards");
                        if (++hops > 16)
                            throw decode_error("too many compression pointers");
                        if (!jumped)
                        {
                            pos_ = p + 2;
                            jumped = true;
                        }
                        p = target;
                        continue;
                    }
                    if (len & compress_mask)
                        throw decode_error("unsupported label type");
                    if (len == 0)
                    {
                        if (!jumped)
                            pos_ = p + 1;
                        break;
                    }
                    need(p + 1, len, "label body");
                    wire_len += len + 1;
                    if (wire_len + 1 > dns_max_name)
                        throw decode_error("name too long");
                    auto label = buf_.substr(p + 1, len);
                    // 名字用'.'拼接,标签里的'.'无法原样编码回去
                    if (label.find('.') != std::string_view::npos)
                        throw decode_error("label contains '.'");
                    if (!out.empty())
                        out += '.';
                    out.append(label);
                    p += len + 1;
                }
                return out;
            }

        private:
            unsigned int byte_at(std::size_t i) const { return static_cast<unsigned char>(buf_[i]); }

            void need(std::size_t at, std::size_t n, const char *what) const
            {
                if (at > buf_.size() || buf_.size() - at < n)
                    throw decode_error(std::string("truncated message reading ") + what);
            }

            std::string_view buf_;
            std::size_t pos_ = 0;
        };

        class wire_writer
        {
        public:
            void u8(uint8_t v) { out_.push_back(static_cast<char>(v)); }

            void u16(uint16_t v)
            {
                u8(v >> 8);
                u8(v & 0xff);
            }

            void u32(uint32_t v)
            {
                u16(v >> 16);
                u16(v & 0xffff);
            }

            void bytes(std::string_view s) { out_.append(s); }

            void patch_u16(std::size_t at, uint16_t v)
            {
                out_[at] = static_cast<char>(v >> 8);
                out_[at + 1] = static_cast<char>(v & 0xff);
            }

            std::size_t size() const { return out_.size(); }
            std::string take() { return std::move(out_); }

        private:
            std::string out_;
        };

        bool supported_class(uint16_t c)
        {
            return c == IN || c == CH || c == HS || c == NONE || c == ANY_CLASS;
        }

        void write_char_string(wire_writer &w, std::string_view s)
        {
            if (s.size() > dns_max_char_string)
                throw encode_error("character-string too long");
            w.u8(static_cast<uint8_t>(s.size()));
            w.bytes(s);
        }

        rdata read_rdata(wire_reader &r, uint16_t type, uint16_t rclass, uint16_t rdlen)
        {
            auto end = r.pos() + rdlen;
            if (rdlen > r.remain())
                throw decode_error("truncated rdata");

            auto check_end = [&](const char *what)
            {
                if (r.pos() != end)
                    throw decode_error(std::string("rdata length mismatch for ") + what);
            };

            if (rclass != IN)
            {
                return raw_rdata{std::string(r.bytes(rdlen))};
            }

            switch (type)
            {
            case A:
            {
                if (rdlen != 4)
                    throw decode_error("A rdata must be 4 bytes");
                auto b = r.bytes(4);
                asio::ip::address_v4::bytes_type ab;
                std::copy(b.begin(), b.end(), ab.begin());
                return asio::ip::address_v4(ab);
            }
            case AAAA:
            {
                if (rdlen != 16)
                    throw decode_error("AAAA rdata must be 16 bytes");
                auto b = r.bytes(16);
                asio::ip::address_v6::bytes_type ab;
                std::copy(b.begin(), b.end(), ab.begin());
                return asio::ip::address_v6(ab);
            }
            case CNAME:
            case NS:
            case PTR:
            {
                domain_name dn{r.name()};
                check_end("name");
                return dn;
            }
            case MX:
            {
                mx_data mx;
                mx.preference = r.u16();
                mx.exchange = r.name();
                check_end("MX");
                return mx;
            }
            case TXT:
            {
                txt_data txt;
                while (r.pos() < end)
                {
                    auto n = r.u8();
                    if (r.pos() + n > end)
                        throw decode_error("TXT character-string overruns rdata");
                    txt.strings.emplace_back(r.bytes(n));
                }
                if (txt.strings.empty())
                    throw decode_error("TXT rdata without character-string");
                return txt;
            }
            default:
                return raw_rdata{std::string(r.bytes(rdlen))};
            }
        }

        dns_record read_record(wire_reader &r)
        {
            dns_record rr;
            rr.name = r.name();
            rr.type = r.u16();
            rr.rclass = r.u16();
            // OPT记录的class是udp负载大小 https://www.rfc-editor.org/rfc/rfc6891#section-6.1.2
            if (rr.type != OPT && !supported_class(rr.rclass))
                throw decode_error("unsupported record class " + std::to_string(rr.rclass));
            rr.ttl = r.u32();
            auto rdlen = r.u16();
            rr.data = read_rdata(r, rr.type, rr.rclass, rdlen);
            return rr;
        }

        void write_rdata(wire_writer &w, const rdata &d)
        {
            std::visit(
                [&w](auto &&v)
                {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, asio::ip::address_v4> || std::is_same_v<T, asio::ip::address_v6>)
                    {
                        auto b = v.to_bytes();
                        w.bytes(std::string_view(reinterpret_cast<const char *>(b.data()), b.size()));
                    }
                    else if constexpr (std::is_same_v<T, domain_name>)
                    {
                        w.bytes(encode_name(v.name));
                    }
                    else if constexpr (std::is_same_v<T, mx_data>)
                    {
                        w.u16(v.preference);
                        w.bytes(encode_name(v.exchange));
                    }
                    else if constexpr (std::is_same_v<T, txt_data>)
                    {
                        // https://www.rfc-editor.org/rfc/rfc1035#section-3.3.14 至少一个character-string
                        if (v.strings.empty())
                            throw encode_error("TXT rdata without character-string");
                        // 超过255字节的拆成多个character-string
                        for (auto &&s : v.strings)
                        {
                            std::string_view sv = s;
                            do
                            {
                                write_char_string(w, sv.substr(0, dns_max_char_string));
                                sv.remove_prefix(std::min(sv.size(), dns_max_char_string));
                            } while (!sv.empty());
                        }
                    }
                    else
                    {
                        w.bytes(v.bytes);
                    }
                },
                d);
        }

        void write_record(wire_writer &w, const dns_record &rr)
        {
            w.bytes(encode_name(rr.name));
            w.u16(rr.type);
            w.u16(rr.rclass);
            w.u32(rr.ttl);
            auto len_at = w.size();
            w.u16(0);
            write_rdata(w, rr.data);
            auto rdlen = w.size() - len_at - 2;
            if (rdlen > 0xffff)
                throw encode_error("rdata too long");
            w.patch_u16(len_at, static_cast<uint16_t>(rdlen));
        }

        uint16_t section_count(std::size_t n)
        {
            if (n > 0xffff)
                throw encode_error("too many records in section");
            return static_cast<uint16_t>(n);
        }
    }

    qtype_kind kind_of(uint16_t type)
    {
        switch (type)
        {
        case A:
            return qtype_kind::A;
        case AAAA:
            return qtype_kind::AAAA;
        case CNAME:
            return qtype_kind::CNAME;
        case MX:
            return qtype_kind::MX;
        case TXT:
            return qtype_kind::TXT;
        default:
            return qtype_kind::unsupported;
        }
    }

    uint16_t type_code(qtype_kind kind)
    {
        switch (kind)
        {
        case qtype_kind::A:
            return A;
        case qtype_kind::AAAA:
            return AAAA;
        case qtype_kind::CNAME:
            return CNAME;
        case qtype_kind::MX:
            return MX;
        case qtype_kind::TXT:
            return TXT;
        default:
            throw std::invalid_argument("unsupported query type has no type code");
        }
    }

    std::string type_name(uint16_t type)
    {
        switch (type)
        {
        case A:
            return "A";
        case NS:
            return "NS";
        case CNAME:
            return "CNAME";
        case SOA:
            return "SOA";
        case PTR:
            return "PTR";
        case MX:
            return "MX";
        case TXT:
            return "TXT";
        case AAAA:
            return "AAAA";
        case SRV:
            return "SRV";
        case OPT:
            return "OPT";
        default:
            return "TYPE" + std::to_string(type);
        }
    }

    std::string txt_data::joined() const
    {
        std::string r;
        for (auto &&s : strings)
        {
            r += s;
        }
        return r;
    }

    dns_message decode_message(std::string_view wire)
    {
        wire_reader r(wire);
        if (wire.size() < dns_header_size)
            throw decode_error("message shorter than header");

        dns_message m;
        m.id = r.u16();
        auto flags = r.u16();
        m.is_response = flags & flag_qr;
        m.opcode = (flags >> opcode_shift) & opcode_mask;
        m.authoritative = flags & flag_aa;
        m.truncated = flags & flag_tc;
        m.recursion_desired = flags & flag_rd;
        m.recursion_available = flags & flag_ra;
        m.rcode = flags & rcode_mask;

        auto qd = r.u16();
        auto an = r.u16();
        auto ns = r.u16();
        auto ar = r.u16();

        m.questions.reserve(qd);
        for (int i = 0; i < qd; i++)
        {
            dns_question q;
            q.name = r.name();
            q.type = r.u16();
            q.qclass = r.u16();
            if (!supported_class(q.qclass))
                throw decode_error("unsupported question class " + std::to_string(q.qclass));
            m.questions.push_back(std::move(q));
        }
        for (int i = 0; i < an; i++)
            m.answers.push_back(read_record(r));
        for (int i = 0; i < ns; i++)
            m.authorities.push_back(read_record(r));
        for (int i = 0; i < ar; i++)
            m.additionals.push_back(read_record(r));

        // 声明的数量和实际数据不符
        if (r.remain() != 0)
            throw decode_error("trailing bytes after declared sections");
        return m;
    }

    std::string encode_message(const dns_message &m)
    {
        wire_writer w;
        w.u16(m.id);

        uint16_t flags = flag_rd | flag_ra;
        if (m.is_response)
            flags |= flag_qr;
        flags |= (m.opcode & opcode_mask) << opcode_shift;
        if (m.authoritative)
            flags |= flag_aa;
        if (m.truncated)
            flags |= flag_tc;
        flags |= m.rcode & rcode_mask;
        w.u16(flags);

        bool with_answers = m.rcode == NOERROR;
        w.u16(section_count(m.questions.size()));
        w.u16(with_answers ? section_count(m.answers.size()) : 0);
        w.u16(section_count(m.authorities.size()));
        w.u16(section_count(m.additionals.size()));

        for (auto &&q : m.questions)
        {
            w.bytes(encode_name(q.name));
            w.u16(q.type);
            w.u16(q.qclass);
        }
        if (with_answers)
        {
            for (auto &&rr : m.answers)
                write_record(w, rr);
        }
        for (auto &&rr : m.authorities)
            write_record(w, rr);
        for (auto &&rr : m.additionals)
            write_record(w, rr);

        if (w.size() > dns_max_message)
            throw encode_error("message exceeds 65535 bytes");
        return w.take();
    }

    std::optional<uint16_t> peek_id(std::string_view wire)
    {
        if (wire.size() < 2)
            return std::nullopt;
        return static_cast<uint16_t>((static_cast<unsigned char>(wire[0]) << 8) | static_cast<unsigned char>(wire[1]));
    }

    std::string encode_name(std::string_view name)
    {
        if (name.ends_with('.'))
            name.remove_suffix(1);

        std::string result;
        result.reserve(name.size() + 2);
        while (!name.empty())
        {
            auto dot = name.find('.');
            auto label = name.substr(0, dot);
            if (label.empty())
                throw encode_error("empty label in name");
            if (label.size() > dns_max_label)
                throw encode_error("label longer than 63 bytes");
            result += static_cast<char>(label.size());
            result.append(label);
            if (dot == std::string_view::npos)
                break;
            name.remove_prefix(dot + 1);
            if (name.empty())
                throw encode_error("empty label in name");
        }
        result += '\0';
        if (result.size() > dns_max_name)
            throw encode_error("name longer than 255 bytes");
        return result;
    }

    std::string to_lower(std::string_view s)
    {
        std::string r;
        r.reserve(s.size());
        for (auto i : s)
        {
            r += static_cast<char>(std::tolower(static_cast<unsigned char>(i)));
        }
        return r;
    }

    bool name_equal(std::string_view a, std::string_view b)
    {
        if (a.ends_with('.'))
            a.remove_suffix(1);
        if (b.ends_with('.'))
            b.remove_suffix(1);
        return to_lower(a) == to_lower(b);
    }

} // namespace encdns
