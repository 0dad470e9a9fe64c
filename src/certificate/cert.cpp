#include "cert.h"

#include <cstring>
#include <stdexcept>
#include <fstream>
#include <sstream>
#include <filesystem>

#include <openssl/bio.h>
#include <openssl/err.h>

#include <spdlog/spdlog.h>

namespace encdns
{
    namespace
    {
        using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free_all)>;

        [[noreturn]] void throw_openssl(const char *what)
        {
            char buff[256]{};
            ERR_error_string_n(ERR_get_error(), buff, sizeof(buff));
            throw std::runtime_error(std::string(what) + ": " + buff);
        }

        std::string bio_to_string(BIO *bio)
        {
            auto size = BIO_pending(bio);
            std::string r;
            r.resize(size);
            if (size > 0 && BIO_read(bio, r.data(), size) != size)
            {
                throw_openssl("BIO_read");
            }
            return r;
        }

        X509_NAME *make_name(const std::vector<name_entry> &ne)
        {
            auto name = X509_NAME_new();
            for (auto &&i : ne)
            {
                X509_NAME_add_entry_by_NID(name, i.nid_, MBSTRING_ASC, (const unsigned char *)i.val_.data(), i.val_.size(), -1, 0);
            }
            return name;
        }

        void add_conf_ext(X509 *cert, int nid, const char *value)
        {
            auto e = X509V3_EXT_conf_nid(nullptr, nullptr, nid, value);
            if (e == nullptr)
            {
                throw_openssl("X509V3_EXT_conf_nid");
            }
            X509_add_ext(cert, e, -1);
            X509_EXTENSION_free(e);
        }

        std::string read_file(const std::string &path)
        {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw std::runtime_error("打开文件失败: " + path);
            }
            std::stringstream ss;
            ss << ifs.rdbuf();
            return ss.str();
        }

        void write_file(const std::string &path, const std::string &content)
        {
            std::filesystem::path p(path);
            if (p.has_parent_path())
            {
                std::filesystem::create_directories(p.parent_path());
            }
            std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw std::runtime_error("打开文件失败: " + path);
            }
            ofs << content;
        }
    }

    x509_ptr make_x509()
    {
        return {X509_new(), X509_free};
    }

    // 创建pkey
    pkey_ptr make_pkey(int bits)
    {
        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free};
        EVP_PKEY *pkey = nullptr;
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 || EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0 || EVP_PKEY_keygen(ctx.get(), &pkey) <= 0)
        {
            throw_openssl("make_pkey");
        }
        return {pkey, EVP_PKEY_free};
    }

    // Version
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.1
    void set_version(X509 *cert)
    {
        X509_set_version(cert, X509_VERSION_3);
    }

    // Serial Number
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.2
    void set_serialNumber(X509 *cert)
    {
        unsigned char buff[20];
        if (RAND_bytes(buff, sizeof(buff)) != 1)
        {
            throw_openssl("RAND_bytes");
        }
        buff[0] &= 0x7f; /* Ensure positive serial! */

        BIGNUM *serial_bn = BN_bin2bn(buff, sizeof(buff), nullptr);
        if (serial_bn == nullptr)
        {
            throw_openssl("BN_bin2bn");
        }
        auto *serial = ASN1_INTEGER_new();
        BN_to_ASN1_INTEGER(serial_bn, serial);
        X509_set_serialNumber(cert, serial);

        ASN1_INTEGER_free(serial);
        BN_free(serial_bn);
    }

    // Issuer
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.4
    void set_issuer(X509 *cert, const std::vector<name_entry> &ne)
    {
        auto name = make_name(ne);
        X509_set_issuer_name(cert, name);
        X509_NAME_free(name);
    }

    // Validity
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.5
    void set_validity(X509 *cert, long days)
    {
        // 这两个时间点都是包含的
        X509_time_adj_ex(X509_getm_notBefore(cert), 0, 0, nullptr);
        X509_time_adj_ex(X509_getm_notAfter(cert), days, 0, nullptr);
    }

    // Subject
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.6
    void set_subject(X509 *cert, const std::vector<name_entry> &ne)
    {
        auto name = make_name(ne);
        X509_set_subject_name(cert, name);
        X509_NAME_free(name);
    }

    // Subject Public Key Info
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.1.2.7
    void set_pubkey(X509 *cert, EVP_PKEY *pkey)
    {
        X509_set_pubkey(cert, pkey);
    }

    /*********扩展**********/
    // key usage
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.2.1.3
    void add_server_key_usage(X509 *cert)
    {
        add_conf_ext(cert, NID_key_usage, "critical,digitalSignature,keyEncipherment");
    }

    // https://www.rfc-editor.org/rfc/rfc5280#section-4.2.1.12
    void add_server_EKU(X509 *cert)
    {
        add_conf_ext(cert, NID_ext_key_usage, "serverAuth");
    }

    // Subject Key Identifier
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.2.1.2
    void add_SKI(X509 *cert)
    {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        // https://www.openssl.org/docs/manmaster/man3/X509_pubkey_digest.html
        X509_pubkey_digest(cert, EVP_sha1(), md, &md_len);

        auto oct = ASN1_OCTET_STRING_new();
        ASN1_OCTET_STRING_set(oct, md, md_len);
        X509_add1_ext_i2d(cert, NID_subject_key_identifier, oct, 0, X509V3_ADD_DEFAULT);
        ASN1_OCTET_STRING_free(oct);
    }

    // Subject Alternative Name
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.2.1.6
    void add_SAN(X509 *cert, const std::vector<std::string> &dns_names, const std::vector<std::string> &ip_addrs)
    {
        if (dns_names.empty() && ip_addrs.empty())
        {
            return;
        }
        GENERAL_NAMES *gens = sk_GENERAL_NAME_new_null();

        for (auto &dns_name : dns_names)
        {
            GENERAL_NAME *gen_dns = GENERAL_NAME_new();
            ASN1_IA5STRING *ia5 = ASN1_IA5STRING_new();
            ASN1_STRING_set(ia5, dns_name.data(), dns_name.length());
            GENERAL_NAME_set0_value(gen_dns, GEN_DNS, ia5);
            sk_GENERAL_NAME_push(gens, gen_dns);
        }
        for (auto &ip : ip_addrs)
        {
            // v4和v6都可以
            auto octet = a2i_IPADDRESS(ip.c_str());
            if (octet == nullptr)
            {
                sk_GENERAL_NAME_pop_free(gens, GENERAL_NAME_free);
                throw std::invalid_argument("add_SAN: 不合法的ip " + ip);
            }
            GENERAL_NAME *gen_ip = GENERAL_NAME_new();
            GENERAL_NAME_set0_value(gen_ip, GEN_IPADD, octet);
            sk_GENERAL_NAME_push(gens, gen_ip);
        }

        X509_add1_ext_i2d(cert, NID_subject_alt_name, gens, 0, X509V3_ADD_DEFAULT);
        sk_GENERAL_NAME_pop_free(gens, GENERAL_NAME_free);
    }

    // Basic Constraints
    // https://www.rfc-editor.org/rfc/rfc5280#section-4.2.1.9
    void add_server_BS(X509 *cert)
    {
        add_conf_ext(cert, NID_basic_constraints, "critical,CA:FALSE");
    }

    // 签名
    void sign(X509 *cert, EVP_PKEY *pkey)
    {
        if (X509_sign(cert, pkey, EVP_sha256()) <= 0)
        {
            throw_openssl("X509_sign");
        }
    }

    std::string make_pem_str(X509 *cert)
    {
        bio_ptr bio{BIO_new(BIO_s_mem()), BIO_free_all};
        if (!PEM_write_bio_X509(bio.get(), cert))
        {
            throw_openssl("PEM_write_bio_X509");
        }
        return bio_to_string(bio.get());
    }

    std::string make_pem_str(EVP_PKEY *pkey)
    {
        bio_ptr bio{BIO_new(BIO_s_mem()), BIO_free_all};
        if (!PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0, nullptr, nullptr))
        {
            throw_openssl("PEM_write_bio_PrivateKey");
        }
        return bio_to_string(bio.get());
    }

    x509_ptr make_x509(std::string_view cert)
    {
        bio_ptr bp{BIO_new_mem_buf(cert.data(), static_cast<int>(cert.size())), BIO_free_all};
        if (!bp)
        {
            throw std::runtime_error("bio 打开失败");
        }
        auto c = PEM_read_bio_X509(bp.get(), nullptr, nullptr, nullptr);
        if (c == nullptr)
        {
            throw_openssl("make_x509");
        }
        return {c, X509_free};
    }

    pkey_ptr make_pkey(std::string_view pkey)
    {
        bio_ptr bp{BIO_new_mem_buf(pkey.data(), static_cast<int>(pkey.size())), BIO_free_all};
        if (!bp)
        {
            throw std::runtime_error("bio 打开失败");
        }
        auto p = PEM_read_bio_PrivateKey(bp.get(), nullptr, nullptr, nullptr);
        if (p == nullptr)
        {
            throw_openssl("读取密钥错误");
        }
        return {p, EVP_PKEY_free};
    }

    subject_identify make_self_signed(long days)
    {
        auto cert = make_x509();
        auto pkey = make_pkey();
        set_version(cert.get());
        set_serialNumber(cert.get());
        set_validity(cert.get(), days);
        // 自签名,issuer就是subject
        set_issuer(cert.get());
        set_subject(cert.get());
        set_pubkey(cert.get(), pkey.get());
        add_server_BS(cert.get());
        add_server_key_usage(cert.get());
        add_server_EKU(cert.get());
        add_SKI(cert.get());
        add_SAN(cert.get(), {"localhost"}, {"127.0.0.1", "::1"});
        sign(cert.get(), pkey.get());
        return {make_pem_str(pkey.get()), make_pem_str(cert.get())};
    }

    std::optional<subject_identify> load_identity(const std::string &cert_path, const std::string &key_path)
    {
        if (!std::filesystem::exists(cert_path) || !std::filesystem::exists(key_path))
        {
            return std::nullopt;
        }
        return subject_identify{read_file(key_path), read_file(cert_path)};
    }

    void save_identity(const subject_identify &si, const std::string &cert_path, const std::string &key_path)
    {
        write_file(key_path, si.pkey_pem_);
        std::filesystem::permissions(key_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
        spdlog::warn("save_identity: 保存{}成功", key_path);
        write_file(cert_path, si.cert_pem_);
        spdlog::warn("save_identity: 保存{}成功", cert_path);
    }

    cert_info describe(std::string_view cert_pem)
    {
        auto cert = make_x509(cert_pem);
        cert_info ci;

        auto name_str = [](X509_NAME *name)
        {
            bio_ptr bio{BIO_new(BIO_s_mem()), BIO_free_all};
            X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_ONELINE);
            return bio_to_string(bio.get());
        };
        auto time_str = [](const ASN1_TIME *t)
        {
            bio_ptr bio{BIO_new(BIO_s_mem()), BIO_free_all};
            ASN1_TIME_print(bio.get(), t);
            return bio_to_string(bio.get());
        };

        ci.subject_ = name_str(X509_get_subject_name(cert.get()));
        ci.issuer_ = name_str(X509_get_issuer_name(cert.get()));
        ci.not_before_ = time_str(X509_get0_notBefore(cert.get()));
        ci.not_after_ = time_str(X509_get0_notAfter(cert.get()));
        return ci;
    }
} // namespace encdns
