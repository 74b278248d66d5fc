#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../shared/op_result.h"

enum proxy_kind : uint8_t
{
    proxy_forward    = 0,
    proxy_tls_tunnel = 1
};

enum desired_state : uint8_t
{
    desired_stopped = 0,
    desired_running = 1
};

enum instance_status : uint8_t
{
    status_initializing = 0,
    status_running      = 1,
    status_stopped      = 2,
    status_error        = 3
};

struct forward_proxy_params
{
    bool https_enabled = false;
    bool dpi_evasion_enabled = false;
};

struct tls_tunnel_params
{
    std::string forward_address;   // host:port
    std::string cover_domain;      // empty: no cover site
    uint16_t cover_site_port = 0;  // loopback port of the cover site
};

using proxy_params = std::variant<forward_proxy_params, tls_tunnel_params>;

// Durable metadata of one instance (instance.json)
struct instance_record
{
    std::string name;
    proxy_params params;
    uint16_t port = 0;
    desired_state desired = desired_stopped;
    std::string created_at;
    std::string updated_at;

    proxy_kind kind() const
    {
        return std::holds_alternative<tls_tunnel_params>(params) ? proxy_tls_tunnel : proxy_forward;
    }

    const forward_proxy_params* forward() const { return std::get_if<forward_proxy_params>(&params); }
    forward_proxy_params* forward() { return std::get_if<forward_proxy_params>(&params); }
    const tls_tunnel_params* tunnel() const { return std::get_if<tls_tunnel_params>(&params); }
    tls_tunnel_params* tunnel() { return std::get_if<tls_tunnel_params>(&params); }

    bool https_enabled() const { auto* f = forward(); return f && f->https_enabled; }
    bool dpi_evasion_enabled() const { auto* f = forward(); return f && f->dpi_evasion_enabled; }

    // Whether the daemon needs certs/server.{crt,key}
    bool needs_certificate() const;

    // Listening port plus the loopback cover port, if any
    std::vector<uint16_t> claimed_ports() const;
};

constexpr const char* kind_to_string(proxy_kind k)
{
    return k == proxy_tls_tunnel ? "tls_tunnel" : "forward_proxy";
}

constexpr const char* desired_to_string(desired_state d)
{
    return d == desired_running ? "running" : "stopped";
}

constexpr const char* status_to_string(instance_status s)
{
    switch (s)
    {
        case status_initializing: return "initializing";
        case status_running:      return "running";
        case status_stopped:      return "stopped";
        case status_error:        return "error";
    }
    return "unknown";
}

bool parse_proxy_kind(std::string_view str, proxy_kind& out);
bool parse_desired_state(std::string_view str, desired_state& out);

// ─── Validation ───
// Every check returns err_validation with the offending field in the message.

op_result validate_name(std::string_view name);
op_result validate_port(int64_t port);
op_result validate_forward_address(std::string_view address);
op_result validate_cover_domain(std::string_view domain);
op_result validate_username(std::string_view user);
op_result validate_password(std::string_view password);
op_result validate_common_name(std::string_view cn);

// Full record check, run before anything touches disk
op_result validate_record(const instance_record& record);

// ─── On-disk layout ───

class instance_layout
{
public:
    instance_layout(const std::filesystem::path& instances_dir, std::string_view name)
        : m_dir(instances_dir / std::string(name)) {}

    const std::filesystem::path& dir() const { return m_dir; }

    std::filesystem::path record() const      { return m_dir / "instance.json"; }
    std::filesystem::path squid_conf() const  { return m_dir / "squid.conf"; }
    std::filesystem::path nginx_conf() const  { return m_dir / "nginx.conf"; }
    std::filesystem::path passwd() const      { return m_dir / "passwd"; }
    std::filesystem::path certs_dir() const   { return m_dir / "certs"; }
    std::filesystem::path cert() const        { return m_dir / "certs" / "server.crt"; }
    std::filesystem::path key() const         { return m_dir / "certs" / "server.key"; }
    std::filesystem::path cover_dir() const   { return m_dir / "cover"; }
    std::filesystem::path cover_page() const  { return m_dir / "cover" / "index.html"; }
    std::filesystem::path logs_dir() const    { return m_dir / "logs"; }
    std::filesystem::path daemon_log() const  { return m_dir / "logs" / "daemon.log"; }
    std::filesystem::path run_dir() const     { return m_dir / "run"; }

    std::filesystem::path config_file(proxy_kind kind) const
    {
        return kind == proxy_tls_tunnel ? nginx_conf() : squid_conf();
    }

    std::filesystem::path pid_file(proxy_kind kind) const
    {
        return run_dir() / (kind == proxy_tls_tunnel ? "nginx.pid" : "squid.pid");
    }

private:
    std::filesystem::path m_dir;
};
