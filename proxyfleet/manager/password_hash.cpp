#include "password_hash.h"

#include <algorithm>
#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace {

constexpr std::string_view apr1_magic = "$apr1$";
constexpr char itoa64[] = "./0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr size_t md5_len = 16;

struct md_ctx_deleter
{
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

// Incremental MD5 over EVP; any failure sticks and is reported by finish()
class md5_digest
{
public:
    md5_digest() : m_ctx(EVP_MD_CTX_new())
    {
        m_ok = m_ctx && EVP_DigestInit_ex(m_ctx.get(), EVP_md5(), nullptr) == 1;
    }

    void update(const void* data, size_t len)
    {
        if (m_ok && len > 0)
            m_ok = EVP_DigestUpdate(m_ctx.get(), data, len) == 1;
    }

    void update(std::string_view s) { update(s.data(), s.size()); }

    bool finish(unsigned char out[md5_len])
    {
        unsigned int len = 0;
        if (m_ok)
            m_ok = EVP_DigestFinal_ex(m_ctx.get(), out, &len) == 1 && len == md5_len;
        return m_ok;
    }

private:
    md_ctx_ptr m_ctx;
    bool m_ok = false;
};

void to64(std::string& out, unsigned long v, int n)
{
    while (n-- > 0)
    {
        out += itoa64[v & 0x3f];
        v >>= 6;
    }
}

} // namespace

std::string apr1_crypt(std::string_view password, std::string_view salt)
{
    // Salt ends at the first '$' and is at most 8 characters
    if (salt.substr(0, apr1_magic.size()) == apr1_magic)
        salt.remove_prefix(apr1_magic.size());
    salt = salt.substr(0, std::min(salt.find('$'), salt.size()));
    salt = salt.substr(0, 8);

    unsigned char final_buf[md5_len];

    md5_digest ctx;
    ctx.update(password);
    ctx.update(apr1_magic);
    ctx.update(salt);

    {
        md5_digest alt;
        alt.update(password);
        alt.update(salt);
        alt.update(password);
        if (!alt.finish(final_buf))
            return {};
    }

    for (size_t pl = password.size(); pl > 0; pl -= std::min(pl, md5_len))
        ctx.update(final_buf, std::min(pl, md5_len));

    std::fill(std::begin(final_buf), std::end(final_buf), 0);

    for (size_t i = password.size(); i != 0; i >>= 1)
    {
        if (i & 1)
            ctx.update(final_buf, 1);
        else
            ctx.update(password.data(), 1);
    }

    if (!ctx.finish(final_buf))
        return {};

    // 1000 rounds to slow down brute force
    for (int i = 0; i < 1000; ++i)
    {
        md5_digest round;
        if (i & 1)
            round.update(password);
        else
            round.update(final_buf, md5_len);

        if (i % 3)
            round.update(salt);
        if (i % 7)
            round.update(password);

        if (i & 1)
            round.update(final_buf, md5_len);
        else
            round.update(password);

        if (!round.finish(final_buf))
            return {};
    }

    std::string out(apr1_magic);
    out += salt;
    out += '$';

    auto b = [&final_buf](int i) { return static_cast<unsigned long>(final_buf[i]); };
    to64(out, (b(0) << 16) | (b(6) << 8) | b(12), 4);
    to64(out, (b(1) << 16) | (b(7) << 8) | b(13), 4);
    to64(out, (b(2) << 16) | (b(8) << 8) | b(14), 4);
    to64(out, (b(3) << 16) | (b(9) << 8) | b(15), 4);
    to64(out, (b(4) << 16) | (b(10) << 8) | b(5), 4);
    to64(out, b(11), 2);

    OPENSSL_cleanse(final_buf, sizeof(final_buf));
    return out;
}

std::string apr1_random_salt()
{
    unsigned char raw[8];
    if (RAND_bytes(raw, sizeof(raw)) != 1)
        return {};

    std::string salt;
    salt.reserve(sizeof(raw));
    for (unsigned char c : raw)
        salt += itoa64[c & 0x3f];
    return salt;
}

bool apr1_verify(std::string_view password, std::string_view hash)
{
    if (hash.substr(0, apr1_magic.size()) != apr1_magic)
        return false;

    std::string_view rest = hash.substr(apr1_magic.size());
    size_t dollar = rest.find('$');
    if (dollar == std::string_view::npos)
        return false;

    std::string computed = apr1_crypt(password, rest.substr(0, dollar));
    if (computed.empty() || computed.size() != hash.size())
        return false;

    return CRYPTO_memcmp(computed.data(), hash.data(), hash.size()) == 0;
}
