#include "instance.h"
#include "../cli/command_hashing.h"

#include <charconv>

bool instance_record::needs_certificate() const
{
    if (auto* f = forward())
        return f->https_enabled;
    return !tunnel()->cover_domain.empty();
}

std::vector<uint16_t> instance_record::claimed_ports() const
{
    std::vector<uint16_t> ports;
    if (port != 0)
        ports.push_back(port);
    if (auto* t = tunnel(); t && t->cover_site_port != 0)
        ports.push_back(t->cover_site_port);
    return ports;
}

bool parse_proxy_kind(std::string_view str, proxy_kind& out)
{
    switch (fnv1a(str))
    {
        case fnv1a("forward_proxy"):
        case fnv1a("forward"):
        case fnv1a("squid"):
            out = proxy_forward;
            return true;
        case fnv1a("tls_tunnel"):
        case fnv1a("tunnel"):
        case fnv1a("nginx"):
            out = proxy_tls_tunnel;
            return true;
        default:
            return false;
    }
}

bool parse_desired_state(std::string_view str, desired_state& out)
{
    switch (fnv1a(str))
    {
        case fnv1a("running"): out = desired_running; return true;
        case fnv1a("stopped"): out = desired_stopped; return true;
        default: return false;
    }
}

namespace {

bool is_alnum(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

op_result invalid(std::string msg)
{
    return op_result::fail(err_validation, std::move(msg));
}

// RFC 1123 hostname: dot separated labels of alnum and '-', no edge hyphens
bool is_hostname(std::string_view host)
{
    if (host.empty() || host.size() > 253)
        return false;

    size_t start = 0;
    while (start <= host.size())
    {
        size_t dot = host.find('.', start);
        size_t end = dot == std::string_view::npos ? host.size() : dot;
        std::string_view label = host.substr(start, end - start);

        if (label.empty() || label.size() > 63)
            return false;
        if (label.front() == '-' || label.back() == '-')
            return false;
        for (char c : label)
        {
            if (!is_alnum(c) && c != '-' && c != '_')
                return false;
        }

        if (dot == std::string_view::npos)
            break;
        start = dot + 1;
    }
    return true;
}

bool is_ipv6_literal(std::string_view host)
{
    if (host.size() < 3 || host.front() != '[' || host.back() != ']')
        return false;
    for (char c : host.substr(1, host.size() - 2))
    {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex && c != ':' && c != '.')
            return false;
    }
    return true;
}

} // namespace

op_result validate_name(std::string_view name)
{
    if (name.empty() || name.size() > 64)
        return invalid("name must be 1-64 characters");

    if (name.front() == '.')
        return invalid("name must not start with '.'");

    for (char c : name)
    {
        if (!is_alnum(c) && c != '.' && c != '-' && c != '_')
            return invalid("name may only contain letters, digits, '.', '-' and '_'");
    }
    return op_result::ok();
}

op_result validate_port(int64_t port)
{
    if (port < 1024 || port > 65535)
        return invalid("invalid port " + std::to_string(port) + " (allowed 1024-65535)");
    return op_result::ok();
}

op_result validate_forward_address(std::string_view address)
{
    if (address.empty())
        return invalid("forward_address is required for tls_tunnel");

    size_t colon = address.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == address.size())
        return invalid("forward_address must be host:port");

    std::string_view host = address.substr(0, colon);
    std::string_view port_str = address.substr(colon + 1);

    int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port < 1 || port > 65535)
        return invalid("forward_address port must be 1-65535");

    if (!is_hostname(host) && !is_ipv6_literal(host))
        return invalid("forward_address host is not a valid hostname or address");

    return op_result::ok();
}

op_result validate_cover_domain(std::string_view domain)
{
    if (domain.empty())
        return op_result::ok();
    if (!is_hostname(domain))
        return invalid("cover_domain is not a valid hostname");
    return op_result::ok();
}

op_result validate_username(std::string_view user)
{
    if (user.empty() || user.size() > 32)
        return invalid("username must be 1-32 characters");
    for (char c : user)
    {
        if (!is_alnum(c) && c != '_')
            return invalid("username may only contain letters, digits and '_'");
    }
    return op_result::ok();
}

op_result validate_password(std::string_view password)
{
    if (password.empty())
        return invalid("password must not be empty");
    if (password.size() > 128)
        return invalid("password is longer than 128 characters");
    for (char c : password)
    {
        if (c == ':' || c == '\n' || c == '\r' || c == '\0')
            return invalid("password must not contain ':' or line breaks");
    }
    return op_result::ok();
}

op_result validate_common_name(std::string_view cn)
{
    if (cn.empty() || cn.size() > 64)
        return invalid("common name must be 1-64 characters");
    for (char c : cn)
    {
        if (!is_alnum(c) && c != '.' && c != '-' && c != '_' && c != '*')
            return invalid("common name contains an invalid character");
    }
    return op_result::ok();
}

op_result validate_record(const instance_record& record)
{
    if (auto r = validate_name(record.name); !r)
        return r;
    if (auto r = validate_port(record.port); !r)
        return r;

    if (auto* t = record.tunnel())
    {
        if (auto r = validate_forward_address(t->forward_address); !r)
            return r;
        if (auto r = validate_cover_domain(t->cover_domain); !r)
            return r;
        if (t->cover_site_port != 0 && t->cover_site_port == record.port)
            return invalid("cover site port collides with the listening port");
    }
    return op_result::ok();
}
