#include "proxy_manager.h"
#include "ovpn_patcher.h"
#include "../shared/logging.h"

#include <cerrno>
#include <charconv>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

proxy_manager::proxy_manager(manager_config cfg)
    : m_cfg(std::move(cfg)),
      m_owner(file_owner::resolve(m_cfg.runtime_user)),
      m_registry(m_cfg.instances_dir(), m_owner),
      m_generator(m_cfg),
      m_certs(m_cfg.instances_dir(), m_owner),
      m_auth(m_cfg.instances_dir(), m_owner),
      m_supervisor(m_cfg, m_generator, m_certs, m_auth, m_owner),
      m_reconciler(m_supervisor)
{
}

proxy_manager::~proxy_manager() = default;

op_result proxy_manager::init()
{
    if (auto r = ensure_directory(m_cfg.data_dir, 0750, m_owner); !r)
        return r;
    return m_registry.init();
}

std::string proxy_manager::default_common_name(const instance_record& record)
{
    if (auto* t = record.tunnel(); t && !t->cover_domain.empty())
        return t->cover_domain;
    return record.name;
}

op_result proxy_manager::set_desired(instance_record& record, desired_state desired)
{
    if (record.desired == desired)
        return op_result::ok();
    record.desired = desired;
    return m_registry.update(record);
}

// ─── Create ───

op_result proxy_manager::create(const create_request& req, instance_record& out)
{
    instance_record record;
    record.name = req.name;
    record.desired = desired_stopped;

    if (auto r = validate_name(req.name); !r)
        return r;
    if (auto r = validate_port(req.port); !r)
        return r;
    record.port = static_cast<uint16_t>(req.port);

    if (req.kind == proxy_forward)
    {
        if (!req.forward_address.empty() || !req.cover_domain.empty())
            return op_result::fail(err_validation, "forward_address and cover_domain apply to tls_tunnel only");
        forward_proxy_params fp;
        fp.https_enabled = req.https_enabled;
        fp.dpi_evasion_enabled = req.dpi_evasion_enabled;
        record.params = fp;
    }
    else
    {
        if (req.https_enabled || req.dpi_evasion_enabled)
            return op_result::fail(err_validation, "https and dpi evasion apply to forward_proxy only");
        if (!req.users.empty())
            return op_result::fail(err_validation, "users apply to forward_proxy only");
        tls_tunnel_params tp;
        tp.forward_address = req.forward_address;
        tp.cover_domain = req.cover_domain;
        record.params = std::move(tp);
    }

    if (auto r = validate_record(record); !r)
        return r;

    std::set<std::string, std::less<>> seen;
    for (const auto& [user, password] : req.users)
    {
        if (auto r = validate_username(user); !r)
            return r;
        if (auto r = validate_password(password); !r)
            return r;
        if (!seen.insert(user).second)
            return op_result::fail(err_duplicate_user, "user '" + user + "' given twice");
    }

    cert_params cp;
    if (record.needs_certificate())
    {
        cp.common_name = req.common_name.empty() ? default_common_name(record) : req.common_name;
        if (auto r = certificate_manager::validate(cp); !r)
            return r;
    }

    auto lock = m_supervisor.acquire(record.name);

    if (auto r = m_registry.create(record); !r)
        return r;

    // Artifacts; a failure here unregisters the half-built instance
    auto rollback = [this, &record](op_result r) {
        LOG_ERRORF("create %s failed: %s", record.name.c_str(), r.describe().c_str());
        if (auto rr = m_registry.remove(record.name); !rr)
            LOG_ERRORF("rollback of %s failed: %s", record.name.c_str(), rr.message.c_str());
        return r;
    };

    for (const auto& [user, password] : req.users)
    {
        if (auto r = m_auth.add(record.name, user, password); !r)
            return rollback(std::move(r));
    }

    if (record.needs_certificate())
    {
        if (auto r = m_certs.generate(record.name, cp); !r)
            return rollback(std::move(r));
    }

    if (auto r = m_supervisor.prepare(record); !r)
        return rollback(std::move(r));

    if (req.autostart)
    {
        if (auto r = set_desired(record, desired_running); !r)
            return rollback(std::move(r));

        out = record;
        return m_supervisor.start(record, lock);
    }

    out = record;
    return op_result::ok();
}

// ─── Start / stop ───

op_result proxy_manager::start(std::string_view name)
{
    if (auto r = validate_name(name); !r)
        return r;

    auto lock = m_supervisor.acquire(name);

    instance_record record;
    if (auto r = m_registry.get(name, record); !r)
        return r;

    // Intent is durable before the process is touched
    if (auto r = set_desired(record, desired_running); !r)
        return r;

    return m_supervisor.start(record, lock);
}

op_result proxy_manager::stop(std::string_view name)
{
    if (auto r = validate_name(name); !r)
        return r;

    auto lock = m_supervisor.acquire(name);

    instance_record record;
    if (auto r = m_registry.get(name, record); !r)
        return r;

    if (auto r = set_desired(record, desired_stopped); !r)
        return r;

    return m_supervisor.stop(name, lock);
}

op_result proxy_manager::restart(std::string_view name)
{
    if (auto r = validate_name(name); !r)
        return r;

    auto lock = m_supervisor.acquire(name);

    instance_record record;
    if (auto r = m_registry.get(name, record); !r)
        return r;

    if (auto r = set_desired(record, desired_running); !r)
        return r;

    return m_supervisor.restart(record, lock);
}

// ─── Update ───

op_result proxy_manager::update(std::string_view name, const update_patch& patch, instance_record& out)
{
    if (auto r = validate_name(name); !r)
        return r;
    if (patch.port)
    {
        if (auto r = validate_port(*patch.port); !r)
            return r;
    }
    if (patch.common_name)
    {
        if (auto r = validate_common_name(*patch.common_name); !r)
            return r;
    }

    auto lock = m_supervisor.acquire(name);

    instance_record current;
    if (auto r = m_registry.get(name, current); !r)
        return r;

    instance_record next = current;
    bool regen_cert = patch.common_name.has_value();

    if (patch.port)
        next.port = static_cast<uint16_t>(*patch.port);

    if (auto* fp = next.forward())
    {
        if (patch.forward_address || patch.cover_domain)
            return op_result::fail(err_validation, "forward_address and cover_domain apply to tls_tunnel only");
        if (patch.https_enabled)
        {
            if (*patch.https_enabled && !fp->https_enabled)
                regen_cert = true;
            fp->https_enabled = *patch.https_enabled;
        }
        if (patch.dpi_evasion_enabled)
            fp->dpi_evasion_enabled = *patch.dpi_evasion_enabled;
    }
    else
    {
        auto* tp = next.tunnel();
        if (patch.https_enabled || patch.dpi_evasion_enabled)
            return op_result::fail(err_validation, "https and dpi evasion apply to forward_proxy only");
        if (patch.forward_address)
            tp->forward_address = *patch.forward_address;
        if (patch.cover_domain && *patch.cover_domain != tp->cover_domain)
        {
            tp->cover_domain = *patch.cover_domain;
            regen_cert = true;
        }
        // Pick the cover port again rather than let it collide with the new port
        if (next.port != current.port)
            tp->cover_site_port = 0;
    }

    if (auto r = validate_record(next); !r)
        return r;

    if (regen_cert && !next.needs_certificate())
    {
        if (patch.common_name)
            return op_result::fail(err_validation, "instance does not use a certificate");
        regen_cert = false;
    }

    cert_params cp;
    if (regen_cert)
    {
        cp.common_name = patch.common_name ? *patch.common_name : default_common_name(next);
        if (auto r = certificate_manager::validate(cp); !r)
            return r;

        // Before the record: a failure leaves the record and the running
        // daemon as they were
        if (auto r = m_certs.generate(next.name, cp); !r)
            return r;
    }

    if (auto r = m_registry.update(next); !r)
        return r;

    out = next;

    bool running = m_supervisor.is_running(next.name);
    if (running)
    {
        LOG_INFOF("%s: configuration changed, restarting", next.name.c_str());
        return m_supervisor.restart(next, lock);
    }
    return m_supervisor.prepare(next);
}

// ─── Remove ───

op_result proxy_manager::remove(std::string_view name)
{
    if (auto r = validate_name(name); !r)
        return r;

    auto lock = m_supervisor.acquire(name);

    if (!m_registry.exists(name))
        return op_result::fail(err_not_found, "instance '" + std::string(name) + "' not found");

    if (auto r = m_supervisor.stop(name, lock); !r)
        return r;

    // Registry record goes last, after the process is gone
    if (auto r = m_registry.remove(name); !r)
        return r;

    m_supervisor.forget(name);
    return op_result::ok();
}

// ─── Users ───

op_result proxy_manager::get_forward(std::string_view name, instance_record& out) const
{
    if (auto r = m_registry.get(name, out); !r)
        return r;
    if (out.kind() != proxy_forward)
        return op_result::fail(err_validation, "users apply to forward_proxy instances only");
    return op_result::ok();
}

op_result proxy_manager::add_user(std::string_view name, std::string_view user, std::string_view password)
{
    if (auto r = validate_name(name); !r)
        return r;
    if (auto r = validate_username(user); !r)
        return r;
    if (auto r = validate_password(password); !r)
        return r;

    auto lock = m_supervisor.acquire(name);

    instance_record record;
    if (auto r = get_forward(name, record); !r)
        return r;

    // squid's auth helper picks up passwd changes on its own
    return m_auth.add(name, user, password);
}

op_result proxy_manager::remove_user(std::string_view name, std::string_view user)
{
    if (auto r = validate_name(name); !r)
        return r;
    if (auto r = validate_username(user); !r)
        return r;

    auto lock = m_supervisor.acquire(name);

    instance_record record;
    if (auto r = get_forward(name, record); !r)
        return r;

    return m_auth.remove(name, user);
}

op_result proxy_manager::list_users(std::string_view name, std::vector<std::string>& users) const
{
    if (auto r = validate_name(name); !r)
        return r;

    instance_record record;
    if (auto r = get_forward(name, record); !r)
        return r;

    return m_auth.list(name, users);
}

// ─── Certificates ───

op_result proxy_manager::regenerate_cert(std::string_view name, const cert_params& params)
{
    if (auto r = validate_name(name); !r)
        return r;

    auto lock = m_supervisor.acquire(name);

    instance_record record;
    if (auto r = m_registry.get(name, record); !r)
        return r;

    if (!record.needs_certificate())
        return op_result::fail(err_validation, "instance does not use a certificate");

    cert_params cp = params;
    if (cp.common_name.empty())
        cp.common_name = default_common_name(record);

    if (auto r = m_certs.regenerate(name, cp); !r)
        return r;

    if (m_supervisor.is_running(name))
        return m_supervisor.restart(record, lock);
    return op_result::ok();
}

op_result proxy_manager::get_cert_info(std::string_view name, cert_info& out) const
{
    if (auto r = validate_name(name); !r)
        return r;
    if (!m_registry.exists(name))
        return op_result::fail(err_not_found, "instance '" + std::string(name) + "' not found");
    return m_certs.info(name, out);
}

// ─── Checks ───

op_result proxy_manager::get_running(std::string_view name, instance_record& out) const
{
    if (auto r = validate_name(name); !r)
        return r;
    if (auto r = m_registry.get(name, out); !r)
        return r;
    if (!m_supervisor.is_running(name))
        return op_result::fail(err_validation, "instance '" + std::string(name) + "' is not running");
    return op_result::ok();
}

op_result proxy_manager::test_connectivity(std::string_view name, const connectivity_request& req,
                                           connectivity_result& out) const
{
    out = {};
    if (req.username.empty() || req.password.empty())
        return op_result::fail(err_validation, "username and password are required");

    instance_record record;
    if (auto r = get_running(name, record); !r)
        return r;
    if (record.kind() != proxy_forward)
        return op_result::fail(err_validation, "tls_tunnel instances are checked with cover or forward");

    std::string url = req.target_url;
    if (url.empty())
        url = record.https_enabled() ? "https://www.google.com" : "http://www.google.com";

    target_url target;
    if (auto r = parse_target_url(url, target); !r)
        return r;

    if (!m_auth.has_users(name))
    {
        out.message = "instance has no users, so the proxy admits nobody";
        return op_result::ok();
    }

    out = check_forward_proxy(record.port, record.https_enabled(), req.username, req.password, target);
    LOG_INFOF("%s: connectivity to %s: %s", record.name.c_str(), url.c_str(), out.message.c_str());
    return op_result::ok();
}

op_result proxy_manager::test_tunnel(std::string_view name, tunnel_check_mode mode, connectivity_result& out) const
{
    out = {};

    instance_record record;
    if (auto r = get_running(name, record); !r)
        return r;

    const tls_tunnel_params* t = record.tunnel();
    if (!t)
        return op_result::fail(err_validation, "cover and forward checks apply to tls_tunnel instances only");

    if (mode == tunnel_check_cover)
    {
        if (t->cover_domain.empty())
            return op_result::fail(err_validation, "instance has no cover site");
        out = check_tls_site("127.0.0.1", record.port, t->cover_domain);
    }
    else
    {
        // validate_record guarantees host:port
        size_t colon = t->forward_address.rfind(':');
        std::string host = t->forward_address.substr(0, colon);
        std::string_view port_str = std::string_view(t->forward_address).substr(colon + 1);
        uint16_t port = 0;
        std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        out = check_tcp_endpoint(host, port);
    }

    LOG_INFOF("%s: %s check: %s", record.name.c_str(), mode == tunnel_check_cover ? "cover" : "forward",
        out.message.c_str());
    return op_result::ok();
}

op_result proxy_manager::patch_ovpn(std::string_view name, const ovpn_request& req, std::string& out)
{
    if (auto r = validate_name(name); !r)
        return r;
    if (auto r = validate_ovpn_content(req.content); !r)
        return r;

    std::string host = req.host;
    if (host.empty())
    {
        char buf[256] = {};
        if (::gethostname(buf, sizeof(buf) - 1) < 0)
            return op_result::fail(err_io, errno_message("gethostname", errno));
        host = buf;
    }
    for (char c : host)
    {
        if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f)
            return op_result::fail(err_validation, "host must not contain whitespace or control characters");
    }

    instance_record record;
    if (auto r = m_registry.get(name, record); !r)
        return r;

    bool with_credentials = !req.username.empty() || !req.password.empty();

    if (record.kind() == proxy_forward)
    {
        if (with_credentials)
        {
            if (auto r = validate_username(req.username); !r)
                return r;
            if (auto r = validate_password(req.password); !r)
                return r;

            bool matches = false;
            if (auto r = m_auth.verify(name, req.username, req.password, matches); !r)
                return r;
            if (!matches)
                return op_result::fail(err_validation, "wrong password for user '" + req.username + "'");
        }

        out = patch_ovpn_for_forward_proxy(req.content, host, record.port, req.username, req.password);
        return op_result::ok();
    }

    if (with_credentials)
        return op_result::fail(err_validation, "tls_tunnel profiles carry no proxy credentials");

    std::string vpn_server;
    std::string patched = patch_ovpn_for_tunnel(req.content, host, record.port, vpn_server);

    if (!vpn_server.empty() && vpn_server != record.tunnel()->forward_address)
    {
        LOG_INFOF("%s: forwarding to %s from the uploaded profile", record.name.c_str(), vpn_server.c_str());
        update_patch patch;
        patch.forward_address = vpn_server;
        if (auto r = update(name, patch, record); !r)
            return r;
    }

    out = std::move(patched);
    return op_result::ok();
}

// ─── Queries ───

op_result proxy_manager::info(std::string_view name, instance_info& out) const
{
    if (auto r = m_registry.get(name, out.record); !r)
        return r;

    out.process = m_supervisor.snapshot(name);
    out.users.clear();
    if (out.record.kind() == proxy_forward)
    {
        if (auto r = m_auth.list(name, out.users); !r)
            LOG_WARNF("%s: cannot read users: %s", out.record.name.c_str(), r.message.c_str());
    }
    out.has_certificate = m_certs.exists(name);
    return op_result::ok();
}

std::vector<instance_info> proxy_manager::list() const
{
    std::vector<instance_info> out;
    for (auto& rec : m_registry.list())
    {
        instance_info ii;
        ii.process = m_supervisor.snapshot(rec.name);
        ii.has_certificate = m_certs.exists(rec.name);
        ii.record = std::move(rec);
        out.push_back(std::move(ii));
    }
    return out;
}

// ─── Logs ───

namespace {

op_result log_path(const fs::path& instances_dir, std::string_view name, std::string_view log,
                   fs::path& out)
{
    if (log.empty())
        log = "daemon";
    if (log != "daemon" && log != "access" && log != "cache" && log != "error")
        return op_result::fail(err_validation, "unknown log '" + std::string(log) +
            "' (daemon, access, cache, error)");

    out = instance_layout(instances_dir, name).logs_dir() / (std::string(log) + ".log");
    return op_result::ok();
}

} // namespace

op_result proxy_manager::read_logs(std::string_view name, std::string_view log, size_t lines,
                                   std::string& out) const
{
    out.clear();
    if (auto r = validate_name(name); !r)
        return r;
    if (!m_registry.exists(name))
        return op_result::fail(err_not_found, "instance '" + std::string(name) + "' not found");

    fs::path path;
    if (auto r = log_path(m_cfg.instances_dir(), name, log, path); !r)
        return r;

    std::string content;
    auto r = read_file(path, content);
    if (r.code == err_not_found)
        return op_result::ok();
    if (!r)
        return r;

    if (lines == 0)
    {
        out = std::move(content);
        return op_result::ok();
    }

    // Keep the last `lines` lines
    size_t pos = content.size();
    if (pos > 0 && content[pos - 1] == '\n')
        --pos;
    size_t count = 0;
    while (pos > 0)
    {
        size_t nl = content.rfind('\n', pos - 1);
        if (nl == std::string::npos)
        {
            pos = 0;
            break;
        }
        if (++count == lines)
        {
            pos = nl + 1;
            break;
        }
        pos = nl;
    }
    out = content.substr(pos);
    return op_result::ok();
}

op_result proxy_manager::clear_logs(std::string_view name)
{
    if (auto r = validate_name(name); !r)
        return r;

    auto lock = m_supervisor.acquire(name);

    if (!m_registry.exists(name))
        return op_result::fail(err_not_found, "instance '" + std::string(name) + "' not found");

    instance_layout layout(m_cfg.instances_dir(), name);

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(layout.logs_dir(), ec))
    {
        if (entry.path().extension() != ".log")
            continue;
        // Truncate in place: the daemon keeps its descriptors open
        if (::truncate(entry.path().c_str(), 0) < 0)
            return op_result::fail(err_io, errno_message(("truncate " + entry.path().string()).c_str(), errno));
    }
    if (ec && ec != std::errc::no_such_file_or_directory)
        return op_result::fail(err_io, "list " + layout.logs_dir().string() + ": " + ec.message());

    return op_result::ok();
}

// ─── Fleet ───

std::vector<reconcile_outcome> proxy_manager::restore()
{
    auto records = m_registry.list();
    LOG_INFOF("restoring %zu instance(s)", records.size());
    return m_reconciler.run(records);
}

void proxy_manager::check_processes()
{
    m_supervisor.check_processes();
}

void proxy_manager::shutdown()
{
    m_supervisor.stop_all();
}
