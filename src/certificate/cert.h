#ifndef SRC_CERTIFICATE_CERT
#define SRC_CERTIFICATE_CERT

#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/pem.h>
#include <openssl/rand.h>

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>

namespace encdns
{
    // pem格式的私钥和证书
    struct subject_identify
    {
        std::string pkey_pem_;
        std::string cert_pem_;
    };

    struct cert_info
    {
        std::string subject_;
        std::string issuer_;
        std::string not_before_;
        std::string not_after_;
    };

    struct name_entry
    {
        int nid_;
        std::string val_;
    };

    const inline std::vector<name_entry> default_name_entries = {
        {NID_commonName, "localhost"},
    };

    using x509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
    using pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

    x509_ptr make_x509();
    pkey_ptr make_pkey(int bits = 2048);
    void set_version(X509 *cert);
    void set_serialNumber(X509 *cert);
    void set_issuer(X509 *cert, const std::vector<name_entry> &ne = default_name_entries);
    void set_validity(X509 *cert, long days = 365);
    void set_subject(X509 *cert, const std::vector<name_entry> &ne = default_name_entries);
    void set_pubkey(X509 *cert, EVP_PKEY *pkey);
    void add_server_key_usage(X509 *cert);
    void add_server_EKU(X509 *cert);
    void add_SKI(X509 *cert);
    void add_SAN(X509 *cert, const std::vector<std::string> &dns_names, const std::vector<std::string> &ip_addrs);
    void add_server_BS(X509 *cert);
    void sign(X509 *cert, EVP_PKEY *pkey);

    std::string make_pem_str(X509 *cert);
    std::string make_pem_str(EVP_PKEY *pkey);

    x509_ptr make_x509(std::string_view cert);
    pkey_ptr make_pkey(std::string_view pkey);

    /// @brief 自签名的服务端证书 CN=localhost SAN: localhost 127.0.0.1 ::1
    subject_identify make_self_signed(long days = 365);

    /// @brief 任意一个文件不存在时返回nullopt,读取失败抛出异常
    std::optional<subject_identify> load_identity(const std::string &cert_path, const std::string &key_path);

    void save_identity(const subject_identify &si, const std::string &cert_path, const std::string &key_path);

    cert_info describe(std::string_view cert_pem);
} // namespace encdns

#endif /* SRC_CERTIFICATE_CERT */
