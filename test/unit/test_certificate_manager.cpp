#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "test_support.h"
#include "manager/certificate_manager.h"
#include "shared/file_util.h"

#include <filesystem>
#include <memory>
#include <sys/stat.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace fs = std::filesystem;

namespace {

struct x509_free_fn { void operator()(X509* x) const { X509_free(x); } };
using x509_handle = std::unique_ptr<X509, x509_free_fn>;

x509_handle load_cert(const fs::path& path)
{
    std::string pem;
    if (!read_file(path, pem))
        return nullptr;
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio)
        return nullptr;
    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return x509_handle(cert);
}

mode_t file_mode(const fs::path& path)
{
    struct stat st{};
    if (stat(path.c_str(), &st) != 0)
        return 0;
    return st.st_mode & 0777;
}

} // namespace

TEST_CASE("certificate parameters")
{
    cert_params p;
    p.common_name = "proxy.example.com";
    CHECK(certificate_manager::validate(p));

    SUBCASE("key size bounds")
    {
        p.key_size = 1024;
        CHECK(certificate_manager::validate(p).code == err_validation);
        p.key_size = 3000;
        CHECK(certificate_manager::validate(p).code == err_validation);
        p.key_size = 16384;
        CHECK(certificate_manager::validate(p).code == err_validation);
        p.key_size = 4096;
        CHECK(certificate_manager::validate(p));
    }

    SUBCASE("validity bounds")
    {
        p.validity_days = 0;
        CHECK(certificate_manager::validate(p).code == err_validation);
        p.validity_days = 3651;
        CHECK(certificate_manager::validate(p).code == err_validation);
    }

    SUBCASE("common name")
    {
        p.common_name = "";
        CHECK(certificate_manager::validate(p).code == err_validation);
        p.common_name = "bad name";
        CHECK(certificate_manager::validate(p).code == err_validation);
    }
}

TEST_CASE("self-signed server certificate")
{
    temp_dir tmp;
    fs::path instances = tmp.path / "instances";
    fs::create_directories(instances / "office");
    fs::permissions(instances / "office", fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);

    certificate_manager certs(instances, {});
    instance_layout layout(instances, "office");

    cert_params p;
    p.common_name = "proxy.example.com";
    p.validity_days = 30;
    REQUIRE(certs.generate("office", p));
    CHECK(certs.exists("office"));

    SUBCASE("files and modes")
    {
        CHECK(file_mode(layout.cert()) == 0640);
        CHECK(file_mode(layout.key()) == 0640);
        CHECK(file_mode(layout.certs_dir()) == 0750);
    }

    SUBCASE("server certificate, not a CA")
    {
        auto cert = load_cert(layout.cert());
        REQUIRE(cert);

        CHECK(X509_check_ca(cert.get()) == 0);
        CHECK((X509_get_extension_flags(cert.get()) & EXFLAG_XKUSAGE) != 0);
        CHECK((X509_get_extended_key_usage(cert.get()) & XKU_SSL_SERVER) != 0);
        CHECK(X509_check_host(cert.get(), "proxy.example.com", 0, 0, nullptr) == 1);
        CHECK(X509_check_host(cert.get(), "localhost", 0, 0, nullptr) == 1);

        // Self-signed: issuer == subject
        CHECK(X509_NAME_cmp(X509_get_subject_name(cert.get()), X509_get_issuer_name(cert.get())) == 0);
    }

    SUBCASE("info")
    {
        cert_info info;
        REQUIRE(certs.info("office", info));
        CHECK(info.common_name == "proxy.example.com");
        CHECK(info.key_size == 2048);
        CHECK_FALSE(info.serial.empty());
        CHECK(info.fingerprint.size() == 32 * 3 - 1);
        CHECK(info.not_before < info.not_after);
    }

    SUBCASE("regenerate replaces the pair")
    {
        cert_info before;
        REQUIRE(certs.info("office", before));

        p.common_name = "other.example.com";
        REQUIRE(certs.regenerate("office", p));

        cert_info after;
        REQUIRE(certs.info("office", after));
        CHECK(after.common_name == "other.example.com");
        CHECK(after.serial != before.serial);
        CHECK(after.fingerprint != before.fingerprint);
    }

    SUBCASE("ensure keeps an existing pair")
    {
        cert_info before;
        REQUIRE(certs.info("office", before));

        REQUIRE(certs.ensure("office", p));
        cert_info after;
        REQUIRE(certs.info("office", after));
        CHECK(after.fingerprint == before.fingerprint);

        fs::remove(layout.key());
        REQUIRE(certs.ensure("office", p));
        REQUIRE(certs.info("office", after));
        CHECK(after.fingerprint != before.fingerprint);
    }
}

TEST_CASE("certificate errors")
{
    temp_dir tmp;
    fs::path instances = tmp.path / "instances";
    fs::create_directories(instances / "office");

    certificate_manager certs(instances, {});

    cert_info info;
    CHECK(certs.info("office", info).code == err_not_found);
    CHECK_FALSE(certs.exists("office"));

    SUBCASE("world-writable instance directory is refused")
    {
        fs::permissions(instances / "office", fs::perms::all);
        cert_params p;
        p.common_name = "office";
        CHECK(certs.generate("office", p).code == err_certificate);
        CHECK_FALSE(certs.exists("office"));
    }
}
