#include "certificate_manager.h"
#include "../shared/logging.h"

#include <cerrno>
#include <cstdio>
#include <ctime>
#include <memory>
#include <unistd.h>
#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace fs = std::filesystem;

namespace {

template <auto Fn>
struct ossl_deleter
{
    template <typename T>
    void operator()(T* p) const { Fn(p); }
};

using pkey_ptr = std::unique_ptr<EVP_PKEY, ossl_deleter<EVP_PKEY_free>>;
using x509_ptr = std::unique_ptr<X509, ossl_deleter<X509_free>>;
using bio_ptr  = std::unique_ptr<BIO, ossl_deleter<BIO_free_all>>;
using bn_ptr   = std::unique_ptr<BIGNUM, ossl_deleter<BN_free>>;
using ext_ptr  = std::unique_ptr<X509_EXTENSION, ossl_deleter<X509_EXTENSION_free>>;

// Drains the OpenSSL error queue into one message
op_result crypto_error(const char* what)
{
    std::string msg(what);
    unsigned long e;
    bool first = true;
    while ((e = ERR_get_error()) != 0)
    {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        msg += first ? ": " : "; ";
        msg += buf;
        first = false;
    }
    return op_result::fail(err_certificate, std::move(msg));
}

bool add_extension(X509* cert, int nid, const std::string& value)
{
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);

    ext_ptr ext(X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str()));
    return ext && X509_add_ext(cert, ext.get(), -1) == 1;
}

bool looks_like_ipv4(std::string_view s)
{
    int dots = 0;
    for (char c : s)
    {
        if (c == '.')
            ++dots;
        else if (c < '0' || c > '9')
            return false;
    }
    return dots == 3;
}

std::string subject_alt_names(const std::string& cn)
{
    std::string san;
    if (looks_like_ipv4(cn))
    {
        if (cn != "127.0.0.1")
            san = "IP:" + cn + ",";
    }
    else if (cn != "localhost")
    {
        san = "DNS:" + cn + ",";
    }
    san += "DNS:localhost,IP:127.0.0.1";
    return san;
}

op_result to_pem(BIO* bio, std::string& out)
{
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data)
        return crypto_error("PEM encoding produced no output");
    out.assign(data, static_cast<size_t>(len));
    return op_result::ok();
}

std::string format_asn1_time(const ASN1_TIME* t)
{
    std::tm tm{};
    if (!t || ASN1_TIME_to_tm(t, &tm) != 1)
        return {};
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

certificate_manager::certificate_manager(fs::path instances_dir, file_owner owner)
    : m_instances_dir(std::move(instances_dir)), m_owner(owner)
{
}

op_result certificate_manager::validate(const cert_params& params)
{
    if (auto r = validate_common_name(params.common_name); !r)
        return r;
    if (params.key_size < min_key_size || params.key_size > max_key_size || params.key_size % 1024 != 0)
        return op_result::fail(err_validation, "key size must be a multiple of 1024 in 2048-8192");
    if (params.validity_days < 1 || params.validity_days > max_validity_days)
        return op_result::fail(err_validation, "validity must be 1-3650 days");
    return op_result::ok();
}

bool certificate_manager::exists(std::string_view instance) const
{
    if (!validate_name(instance))
        return false;
    instance_layout layout(m_instances_dir, instance);
    std::error_code ec;
    return fs::exists(layout.cert(), ec) && fs::exists(layout.key(), ec);
}

op_result certificate_manager::ensure(std::string_view instance, const cert_params& params)
{
    if (exists(instance))
        return op_result::ok();
    return generate(instance, params);
}

op_result certificate_manager::generate(std::string_view instance, const cert_params& params)
{
    if (auto r = validate_name(instance); !r)
        return r;
    if (auto r = validate(params); !r)
        return r;

    instance_layout layout(m_instances_dir, instance);

    if (auto r = check_not_world_writable(layout.dir()); !r)
        return op_result::fail(err_certificate, r.message);
    if (auto r = ensure_directory(layout.certs_dir(), 0750, m_owner); !r)
        return r;
    if (auto r = check_not_world_writable(layout.certs_dir()); !r)
        return op_result::fail(err_certificate, r.message);

    ERR_clear_error();

    pkey_ptr pkey(EVP_RSA_gen(static_cast<unsigned int>(params.key_size)));
    if (!pkey)
        return crypto_error("RSA key generation failed");

    x509_ptr cert(X509_new());
    if (!cert || X509_set_version(cert.get(), 2) != 1)
        return crypto_error("X509_new failed");

    // Random 128-bit serial
    bn_ptr serial(BN_new());
    if (!serial || BN_rand(serial.get(), 128, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
        !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get())))
        return crypto_error("could not set serial number");

    if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
        !X509_time_adj_ex(X509_getm_notAfter(cert.get()), params.validity_days, 0, nullptr))
        return crypto_error("could not set validity");

    if (X509_set_pubkey(cert.get(), pkey.get()) != 1)
        return crypto_error("could not set public key");

    X509_NAME* name = X509_get_subject_name(cert.get());
    if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>(params.common_name.c_str()), -1, -1, 0) != 1 ||
        X509_set_issuer_name(cert.get(), name) != 1)
        return crypto_error("could not set subject");

    if (!add_extension(cert.get(), NID_basic_constraints, "critical,CA:FALSE") ||
        !add_extension(cert.get(), NID_key_usage, "critical,digitalSignature,keyEncipherment") ||
        !add_extension(cert.get(), NID_ext_key_usage, "serverAuth") ||
        !add_extension(cert.get(), NID_subject_key_identifier, "hash") ||
        !add_extension(cert.get(), NID_subject_alt_name, subject_alt_names(params.common_name)))
        return crypto_error("could not add extensions");

    if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) <= 0)
        return crypto_error("signing failed");

    std::string cert_pem, key_pem;
    {
        bio_ptr bio(BIO_new(BIO_s_mem()));
        if (!bio || PEM_write_bio_X509(bio.get(), cert.get()) != 1)
            return crypto_error("could not encode certificate");
        if (auto r = to_pem(bio.get(), cert_pem); !r)
            return r;
    }
    {
        bio_ptr bio(BIO_new(BIO_s_mem()));
        if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
            return crypto_error("could not encode private key");
        if (auto r = to_pem(bio.get(), key_pem); !r)
            return r;
    }

    if (auto r = write_file_atomic(layout.key(), key_pem, 0640, m_owner); !r)
        return r;
    OPENSSL_cleanse(key_pem.data(), key_pem.size());

    if (auto r = write_file_atomic(layout.cert(), cert_pem, 0640, m_owner); !r)
    {
        // Unpaired key: drop it so ensure() regenerates both next time
        ::unlink(layout.key().c_str());
        return r;
    }

    LOG_INFOF("generated certificate for %.*s (CN=%s, %d bits, %d days)",
        static_cast<int>(instance.size()), instance.data(),
        params.common_name.c_str(), params.key_size, params.validity_days);
    return op_result::ok();
}

op_result certificate_manager::info(std::string_view instance, cert_info& out) const
{
    if (auto r = validate_name(instance); !r)
        return r;

    instance_layout layout(m_instances_dir, instance);

    std::string pem;
    if (auto r = read_file(layout.cert(), pem); !r)
    {
        if (r.code == err_not_found)
            return op_result::fail(err_not_found, "no certificate for " + std::string(instance));
        return r;
    }

    ERR_clear_error();

    bio_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio)
        return crypto_error("BIO_new_mem_buf failed");

    x509_ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert)
        return crypto_error("could not parse certificate");

    out = {};

    X509_NAME* subject = X509_get_subject_name(cert.get());
    int idx = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (idx >= 0)
    {
        ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, idx));
        unsigned char* utf8 = nullptr;
        int len = ASN1_STRING_to_UTF8(&utf8, data);
        if (len >= 0 && utf8)
        {
            out.common_name.assign(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
            OPENSSL_free(utf8);
        }
    }

    out.not_before = format_asn1_time(X509_get0_notBefore(cert.get()));
    out.not_after = format_asn1_time(X509_get0_notAfter(cert.get()));

    if (EVP_PKEY* pub = X509_get0_pubkey(cert.get()))
        out.key_size = EVP_PKEY_get_bits(pub);

    bn_ptr serial(ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert.get()), nullptr));
    if (serial)
    {
        char* hex = BN_bn2hex(serial.get());
        if (hex)
        {
            out.serial = hex;
            OPENSSL_free(hex);
        }
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (X509_digest(cert.get(), EVP_sha256(), md, &md_len) != 1)
        return crypto_error("could not compute fingerprint");

    out.fingerprint.reserve(md_len * 3);
    for (unsigned int i = 0; i < md_len; ++i)
    {
        char buf[4];
        std::snprintf(buf, sizeof(buf), i == 0 ? "%02X" : ":%02X", md[i]);
        out.fingerprint += buf;
    }

    return op_result::ok();
}
