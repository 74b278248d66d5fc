#include "connectivity_check.h"
#include "../shared/scoped_fd.h"

#include <cerrno>
#include <charconv>
#include <memory>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

namespace {

template <auto Fn>
struct ossl_deleter
{
    template <typename T>
    void operator()(T* p) const { Fn(p); }
};

using ssl_ctx_ptr = std::unique_ptr<SSL_CTX, ossl_deleter<SSL_CTX_free>>;
using ssl_ptr     = std::unique_ptr<SSL, ossl_deleter<SSL_free>>;

constexpr size_t max_head = 16 * 1024;

connectivity_result failed(std::string message)
{
    connectivity_result r;
    r.message = std::move(message);
    return r;
}

std::string drain_ssl_errors(const char* what)
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
    return msg;
}

bool is_ip_literal(std::string_view host)
{
    if (!host.empty() && host.front() == '[')
        return true;
    for (char c : host)
    {
        if (c != '.' && (c < '0' || c > '9'))
            return false;
    }
    return true;
}

std::string unbracket(std::string_view host)
{
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
        return std::string(host.substr(1, host.size() - 2));
    return std::string(host);
}

// Non-blocking connect bounded by timeouts.connect, then blocking I/O with
// SO_RCVTIMEO/SO_SNDTIMEO set to timeouts.io
bool connect_with_timeout(std::string_view host, uint16_t port, const check_timeouts& timeouts,
                          scoped_fd& out, std::string& error)
{
    std::string name = unbracket(host);
    std::string service = std::to_string(port);
    std::string where = std::string(host) + ":" + service;

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addrs = nullptr;
    int rc = ::getaddrinfo(name.c_str(), service.c_str(), &hints, &addrs);
    if (rc != 0 || !addrs)
    {
        error = "cannot resolve " + name + ": " + ::gai_strerror(rc);
        return false;
    }
    std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> guard(addrs, ::freeaddrinfo);

    error = "connect " + where + " failed";
    for (auto* ai = addrs; ai; ai = ai->ai_next)
    {
        scoped_fd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol));
        if (!fd)
            continue;

        if (::connect(fd.get(), ai->ai_addr, ai->ai_addrlen) < 0)
        {
            if (errno != EINPROGRESS)
            {
                error = errno_message(("connect " + where).c_str(), errno);
                continue;
            }

            struct pollfd pfd{ fd.get(), POLLOUT, 0 };
            int n;
            do
            {
                n = ::poll(&pfd, 1, static_cast<int>(timeouts.connect.count()));
            } while (n < 0 && errno == EINTR);

            if (n == 0)
            {
                error = "connect " + where + " timed out after " +
                        std::to_string(timeouts.connect.count()) + "ms";
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (n < 0 || ::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0)
            {
                error = errno_message(("connect " + where).c_str(), errno);
                continue;
            }
            if (so_error != 0)
            {
                error = errno_message(("connect " + where).c_str(), so_error);
                continue;
            }
        }

        int flags = ::fcntl(fd.get(), F_GETFL);
        if (flags < 0 || ::fcntl(fd.get(), F_SETFL, flags & ~O_NONBLOCK) < 0)
        {
            error = errno_message("fcntl", errno);
            continue;
        }

        struct timeval tv;
        tv.tv_sec = static_cast<time_t>(timeouts.io.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeouts.io.count() % 1000) * 1000);
        ::setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        out = std::move(fd);
        return true;
    }
    return false;
}

// One client connection: plain TCP, TLS, or TLS inside a TLS hop (an
// https target behind an https_port proxy)
class check_channel
{
public:
    explicit check_channel(scoped_fd fd) : m_fd(std::move(fd)) {}

    bool start_tls(std::string_view sni, std::string& error)
    {
        if (!m_ctx)
        {
            m_ctx.reset(SSL_CTX_new(TLS_client_method()));
            if (!m_ctx)
            {
                error = drain_ssl_errors("SSL_CTX_new failed");
                return false;
            }
            SSL_CTX_set_verify(m_ctx.get(), SSL_VERIFY_NONE, nullptr);
        }

        ssl_ptr ssl(SSL_new(m_ctx.get()));
        if (!ssl)
        {
            error = drain_ssl_errors("SSL_new failed");
            return false;
        }

        if (!m_outer)
        {
            SSL_set_fd(ssl.get(), m_fd.get());
        }
        else
        {
            // Records of the inner session travel through the outer one
            BIO* hop = BIO_new(BIO_f_ssl());
            if (!hop)
            {
                error = drain_ssl_errors("BIO_new failed");
                return false;
            }
            BIO_set_ssl(hop, m_outer.get(), BIO_NOCLOSE);
            SSL_set_bio(ssl.get(), hop, hop);
        }

        std::string host(sni);
        if (!host.empty() && !is_ip_literal(host))
            SSL_set_tlsext_host_name(ssl.get(), host.c_str());

        ERR_clear_error();
        if (SSL_connect(ssl.get()) != 1)
        {
            error = drain_ssl_errors("TLS handshake failed");
            return false;
        }

        (m_outer ? m_inner : m_outer) = std::move(ssl);
        return true;
    }

    bool send_all(std::string_view data, std::string& error)
    {
        size_t off = 0;
        while (off < data.size())
        {
            if (SSL* ssl = active())
            {
                int n = SSL_write(ssl, data.data() + off, static_cast<int>(data.size() - off));
                if (n <= 0)
                {
                    error = drain_ssl_errors("SSL_write failed");
                    return false;
                }
                off += static_cast<size_t>(n);
            }
            else
            {
                ssize_t n = ::send(m_fd.get(), data.data() + off, data.size() - off, MSG_NOSIGNAL);
                if (n < 0)
                {
                    if (errno == EINTR)
                        continue;
                    error = errno_message("send", errno);
                    return false;
                }
                off += static_cast<size_t>(n);
            }
        }
        return true;
    }

    // Reads up to the blank line ending the response head
    bool read_head(std::string& head, std::string& error)
    {
        head.clear();
        char buf[1024];
        while (head.find("\r\n\r\n") == std::string::npos)
        {
            if (head.size() > max_head)
            {
                error = "response head too large";
                return false;
            }

            ssize_t n;
            if (SSL* ssl = active())
            {
                int r = SSL_read(ssl, buf, sizeof(buf));
                n = r > 0 ? r : 0;
                if (r <= 0 && SSL_get_error(ssl, r) != SSL_ERROR_ZERO_RETURN)
                {
                    error = drain_ssl_errors("SSL_read failed");
                    return !head.empty();
                }
            }
            else
            {
                n = ::recv(m_fd.get(), buf, sizeof(buf), 0);
                if (n < 0)
                {
                    if (errno == EINTR)
                        continue;
                    error = errno == EAGAIN || errno == EWOULDBLOCK ? std::string("read timed out")
                                                                    : errno_message("recv", errno);
                    return false;
                }
            }

            if (n == 0)
            {
                error = "connection closed";
                return !head.empty();
            }
            head.append(buf, static_cast<size_t>(n));
        }
        return true;
    }

private:
    SSL* active() const
    {
        return m_inner ? m_inner.get() : m_outer.get();
    }

    // Destroyed bottom-up: inner session, outer session, context, socket
    scoped_fd m_fd;
    ssl_ctx_ptr m_ctx;
    ssl_ptr m_outer;
    ssl_ptr m_inner;
};

// "HTTP/1.1 407 ..." -> 407, 0 when the line is not a status line
int parse_status(std::string_view head)
{
    if (head.substr(0, 5) != "HTTP/")
        return 0;
    size_t sp = head.find(' ');
    if (sp == std::string_view::npos || sp + 4 > head.size())
        return 0;

    int code = 0;
    const char* begin = head.data() + sp + 1;
    auto [ptr, ec] = std::from_chars(begin, begin + 3, code);
    if (ec != std::errc() || ptr != begin + 3)
        return 0;
    return code;
}

connectivity_result from_status(int code, std::string_view where)
{
    connectivity_result r;
    r.http_code = code;
    r.success = is_success_status(code);
    if (r.success)
        r.message = "connection succeeded (HTTP " + std::to_string(code) + ")";
    else if (code == 407)
        r.message = "proxy rejected the credentials (HTTP 407)";
    else
        r.message = std::string(where) + " answered HTTP " + std::to_string(code);
    return r;
}

// Sends one request and parses the status of the reply
bool exchange(check_channel& ch, const std::string& request, int& code, std::string& error)
{
    if (!ch.send_all(request, error))
        return false;

    std::string head;
    if (!ch.read_head(head, error))
        return false;

    code = parse_status(head);
    if (code == 0)
    {
        error = "malformed HTTP response";
        return false;
    }
    return true;
}

} // namespace

bool is_success_status(int http_code)
{
    return http_code == 200 || http_code == 301 || http_code == 302 || http_code == 307;
}

std::string basic_auth_header(std::string_view username, std::string_view password)
{
    std::string plain = std::string(username) + ":" + std::string(password);
    std::string encoded(4 * ((plain.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                            reinterpret_cast<const unsigned char*>(plain.data()),
                            static_cast<int>(plain.size()));
    encoded.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return "Basic " + encoded;
}

op_result parse_target_url(std::string_view url, target_url& out)
{
    auto invalid = [&url](const char* why) {
        return op_result::fail(err_validation, "invalid url '" + std::string(url) + "': " + why);
    };

    for (char c : url)
    {
        if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f)
            return invalid("contains whitespace or control characters");
    }

    target_url t;
    std::string_view rest;
    if (url.substr(0, 7) == "http://")
    {
        rest = url.substr(7);
        t.port = 80;
    }
    else if (url.substr(0, 8) == "https://")
    {
        rest = url.substr(8);
        t.tls = true;
        t.port = 443;
    }
    else
    {
        return invalid("scheme must be http or https");
    }

    size_t slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos)
        t.path = std::string(rest.substr(slash));

    if (authority.find('@') != std::string_view::npos)
        return invalid("credentials belong in the proxy login, not the url");

    std::string_view host = authority;
    std::string_view port_str;
    if (!authority.empty() && authority.front() == '[')
    {
        size_t close = authority.find(']');
        if (close == std::string_view::npos)
            return invalid("unterminated IPv6 address");
        host = authority.substr(0, close + 1);
        if (close + 1 < authority.size())
        {
            if (authority[close + 1] != ':')
                return invalid("bad authority");
            port_str = authority.substr(close + 2);
        }
    }
    else if (size_t colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        host = authority.substr(0, colon);
        port_str = authority.substr(colon + 1);
    }

    if (host.empty())
        return invalid("missing host");

    if (!port_str.empty() || authority.back() == ':')
    {
        int port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (port_str.empty() || ec != std::errc() || ptr != port_str.data() + port_str.size() ||
            port < 1 || port > 65535)
            return invalid("port must be 1-65535");
        t.port = static_cast<uint16_t>(port);
    }

    t.host = std::string(host);
    out = std::move(t);
    return op_result::ok();
}

connectivity_result check_forward_proxy(uint16_t proxy_port, bool proxy_tls, std::string_view username,
                                        std::string_view password, const target_url& target,
                                        const check_timeouts& timeouts)
{
    std::string error;
    scoped_fd fd;
    if (!connect_with_timeout("127.0.0.1", proxy_port, timeouts, fd, error))
        return failed(error);

    check_channel ch(std::move(fd));
    if (proxy_tls && !ch.start_tls({}, error))
        return failed("proxy: " + error);

    std::string auth = "Proxy-Authorization: " + basic_auth_header(username, password) + "\r\n";
    std::string authority = target.host + ":" + std::to_string(target.port);

    int code = 0;
    if (!target.tls)
    {
        std::string req = "GET http://" + authority + target.path + " HTTP/1.1\r\n"
                          "Host: " + authority + "\r\n" + auth +
                          "User-Agent: proxyfleet\r\n"
                          "Connection: close\r\n\r\n";
        if (!exchange(ch, req, code, error))
            return failed("proxy: " + error);
        return from_status(code, "target");
    }

    std::string connect = "CONNECT " + authority + " HTTP/1.1\r\n"
                          "Host: " + authority + "\r\n" + auth + "\r\n";
    if (!exchange(ch, connect, code, error))
        return failed("proxy: " + error);
    if (code != 200)
        return from_status(code, "proxy");

    if (!ch.start_tls(target.host, error))
        return failed(target.host + ": " + error);

    std::string req = "GET " + target.path + " HTTP/1.1\r\n"
                      "Host: " + target.host + "\r\n"
                      "User-Agent: proxyfleet\r\n"
                      "Connection: close\r\n\r\n";
    if (!exchange(ch, req, code, error))
        return failed(target.host + ": " + error);
    return from_status(code, "target");
}

connectivity_result check_tls_site(std::string_view host, uint16_t port, std::string_view sni,
                                   const check_timeouts& timeouts)
{
    std::string error;
    scoped_fd fd;
    if (!connect_with_timeout(host, port, timeouts, fd, error))
        return failed(error);

    check_channel ch(std::move(fd));
    if (!ch.start_tls(sni, error))
        return failed(error);

    std::string req = "GET / HTTP/1.1\r\n"
                      "Host: " + std::string(sni.empty() ? host : sni) + "\r\n"
                      "User-Agent: proxyfleet\r\n"
                      "Connection: close\r\n\r\n";
    int code = 0;
    if (!exchange(ch, req, code, error))
        return failed(error);
    return from_status(code, "site");
}

connectivity_result check_tcp_endpoint(std::string_view host, uint16_t port, const check_timeouts& timeouts)
{
    std::string error;
    scoped_fd fd;
    if (!connect_with_timeout(host, port, timeouts, fd, error))
        return failed(error);

    connectivity_result r;
    r.success = true;
    r.message = "connected to " + std::string(host) + ":" + std::to_string(port);
    return r;
}
