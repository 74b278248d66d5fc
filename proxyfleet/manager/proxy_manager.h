#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "auth_store.h"
#include "certificate_manager.h"
#include "config_generator.h"
#include "connectivity_check.h"
#include "instance.h"
#include "instance_registry.h"
#include "manager_config.h"
#include "process_supervisor.h"
#include "reconciler.h"

struct create_request
{
    std::string name;
    proxy_kind kind = proxy_forward;
    int64_t port = 0;

    // forward_proxy
    bool https_enabled = false;
    bool dpi_evasion_enabled = false;

    // tls_tunnel
    std::string forward_address;
    std::string cover_domain;

    // Certificate subject when one is generated; defaults to the instance
    // name (forward proxy) or the cover domain (tunnel)
    std::string common_name;

    std::vector<std::pair<std::string, std::string>> users;
    bool autostart = false;
};

// Partial update: unset fields keep their value
struct update_patch
{
    std::optional<int64_t> port;
    std::optional<bool> https_enabled;
    std::optional<bool> dpi_evasion_enabled;
    std::optional<std::string> forward_address;
    std::optional<std::string> cover_domain;
    std::optional<std::string> common_name;

    bool empty() const
    {
        return !port && !https_enabled && !dpi_evasion_enabled &&
               !forward_address && !cover_domain && !common_name;
    }
};

struct connectivity_request
{
    std::string username;
    std::string password;

    // Empty: http://www.google.com, or https:// when the proxy itself is https
    std::string target_url;
};

enum tunnel_check_mode : uint8_t
{
    tunnel_check_cover   = 0,   // TLS with the cover domain as SNI, GET /
    tunnel_check_forward = 1    // TCP connect to forward_address
};

struct ovpn_request
{
    std::string content;

    // Address clients use to reach this host; empty: gethostname()
    std::string host;

    // Forward proxies only; written inline into the profile
    std::string username;
    std::string password;
};

struct instance_info
{
    instance_record record;
    process_snapshot process;
    std::vector<std::string> users;
    bool has_certificate = false;
};

// Entry point for every management operation. Inputs are re-validated here
// no matter who calls. Mutating operations hold the instance lock for their
// whole duration, so calls on one instance serialize while different
// instances proceed in parallel.
class proxy_manager
{
public:
    explicit proxy_manager(manager_config cfg);
    ~proxy_manager();

    proxy_manager(const proxy_manager&) = delete;
    proxy_manager& operator=(const proxy_manager&) = delete;

    op_result init();

    op_result create(const create_request& req, instance_record& out);
    op_result start(std::string_view name);
    op_result stop(std::string_view name);
    op_result restart(std::string_view name);
    op_result update(std::string_view name, const update_patch& patch, instance_record& out);
    op_result remove(std::string_view name);

    op_result add_user(std::string_view name, std::string_view user, std::string_view password);
    op_result remove_user(std::string_view name, std::string_view user);
    op_result list_users(std::string_view name, std::vector<std::string>& users) const;

    op_result regenerate_cert(std::string_view name, const cert_params& params);
    op_result get_cert_info(std::string_view name, cert_info& out) const;

    // End-to-end checks against a running instance. A check that ran is ok()
    // even when it did not get through; `out` tells which.
    op_result test_connectivity(std::string_view name, const connectivity_request& req,
                                connectivity_result& out) const;
    op_result test_tunnel(std::string_view name, tunnel_check_mode mode, connectivity_result& out) const;

    // OpenVPN profile rewritten to go through the instance. For a tunnel the
    // server the profile pointed at becomes the forward_address (update()).
    op_result patch_ovpn(std::string_view name, const ovpn_request& req, std::string& out);

    op_result info(std::string_view name, instance_info& out) const;
    std::vector<instance_info> list() const;

    // Last `lines` lines of logs/<log>.log (daemon, access, cache, error)
    op_result read_logs(std::string_view name, std::string_view log, size_t lines, std::string& out) const;
    op_result clear_logs(std::string_view name);

    // Starts every instance whose desired state is running
    std::vector<reconcile_outcome> restore();

    void check_processes();

    // Stops all daemons; desired states stay as they are so the next
    // restore() brings the same set back
    void shutdown();

    const manager_config& config() const { return m_cfg; }
    instance_registry& registry() { return m_registry; }
    process_supervisor& supervisor() { return m_supervisor; }

private:
    op_result get_forward(std::string_view name, instance_record& out) const;
    op_result get_running(std::string_view name, instance_record& out) const;
    op_result set_desired(instance_record& record, desired_state desired);

    static std::string default_common_name(const instance_record& record);

    manager_config m_cfg;
    file_owner m_owner;

    instance_registry m_registry;
    config_generator m_generator;
    certificate_manager m_certs;
    auth_store m_auth;
    process_supervisor m_supervisor;
    reconciler m_reconciler;
};
