#include "instance_registry.h"
#include "port_allocator.h"
#include "../shared/json_codec.h"
#include "../shared/logging.h"

#include <algorithm>
#include <cstdio>
#include <random>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view staging_prefix = ".staging-";
constexpr std::string_view removing_prefix = ".removing-";

std::string unique_suffix()
{
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08x", dist(gen));
    return buf;
}

} // namespace

instance_registry::instance_registry(fs::path instances_dir, file_owner owner)
    : m_instances_dir(std::move(instances_dir)), m_owner(owner)
{
}

op_result instance_registry::init()
{
    if (auto r = ensure_directory(m_instances_dir, 0750, m_owner); !r)
        return r;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_instances_dir, ec))
    {
        std::string fname = entry.path().filename().string();
        if (fname.rfind(staging_prefix, 0) == 0 || fname.rfind(removing_prefix, 0) == 0)
        {
            LOG_WARNF("removing leftover %s", entry.path().c_str());
            std::error_code rm_ec;
            fs::remove_all(entry.path(), rm_ec);
        }
    }
    if (ec)
        return op_result::fail(err_io, "scan " + m_instances_dir.string() + ": " + ec.message());

    return op_result::ok();
}

std::string instance_registry::format_json(const instance_record& record)
{
    json_object_writer w;
    w.field("name", record.name)
     .field("proxy_type", kind_to_string(record.kind()))
     .field("port", static_cast<int>(record.port))
     .field("https_enabled", record.https_enabled())
     .field("dpi_evasion_enabled", record.dpi_evasion_enabled());

    if (auto* t = record.tunnel())
    {
        w.field("forward_address", t->forward_address);
        if (!t->cover_domain.empty())
            w.field("cover_domain", t->cover_domain);
        if (t->cover_site_port != 0)
            w.field("cover_site_port", static_cast<int>(t->cover_site_port));
    }

    w.field("desired_state", desired_to_string(record.desired))
     .field("created_at", record.created_at);
    if (!record.updated_at.empty())
        w.field("updated_at", record.updated_at);

    return w.str();
}

op_result instance_registry::parse_json(const std::string& json, instance_record& out)
{
    if (json.find('{') == std::string::npos)
        return op_result::fail(err_io, "not a JSON object");

    out = {};
    out.name = json_get_string(json, "name");

    proxy_kind kind;
    if (!parse_proxy_kind(json_get_string(json, "proxy_type"), kind))
        return op_result::fail(err_io, "unknown proxy_type");

    int64_t port = json_get_int(json, "port", -1);
    if (port < 0 || port > 65535)
        return op_result::fail(err_io, "bad port");
    out.port = static_cast<uint16_t>(port);

    if (kind == proxy_tls_tunnel)
    {
        tls_tunnel_params tp;
        tp.forward_address = json_get_string(json, "forward_address");
        tp.cover_domain = json_get_string(json, "cover_domain");
        int64_t cover = json_get_int(json, "cover_site_port", 0);
        if (cover < 0 || cover > 65535)
            return op_result::fail(err_io, "bad cover_site_port");
        tp.cover_site_port = static_cast<uint16_t>(cover);
        out.params = std::move(tp);
    }
    else
    {
        forward_proxy_params fp;
        fp.https_enabled = json_get_bool(json, "https_enabled");
        fp.dpi_evasion_enabled = json_get_bool(json, "dpi_evasion_enabled");
        out.params = fp;
    }

    if (!parse_desired_state(json_get_string(json, "desired_state"), out.desired))
        return op_result::fail(err_io, "unknown desired_state");

    out.created_at = json_get_string(json, "created_at");
    out.updated_at = json_get_string(json, "updated_at");

    if (auto r = validate_record(out); !r)
        return op_result::fail(err_io, r.message);

    return op_result::ok();
}

op_result instance_registry::read_record(const fs::path& dir, instance_record& out) const
{
    std::string content;
    if (auto r = read_file(dir / "instance.json", content); !r)
        return r;

    if (auto r = parse_json(content, out); !r)
        return op_result::fail(err_io, (dir / "instance.json").string() + ": " + r.message);

    if (out.name != dir.filename().string())
        return op_result::fail(err_io, (dir / "instance.json").string() + ": name does not match directory");

    return op_result::ok();
}

bool instance_registry::exists(std::string_view name) const
{
    if (!validate_name(name))
        return false;
    std::error_code ec;
    return fs::exists(instance_layout(m_instances_dir, name).record(), ec);
}

op_result instance_registry::get(std::string_view name, instance_record& out) const
{
    if (auto r = validate_name(name); !r)
        return r;

    instance_layout layout(m_instances_dir, name);
    auto r = read_record(layout.dir(), out);
    if (r.code == err_not_found)
        return op_result::fail(err_not_found, "instance '" + std::string(name) + "' not found");
    return r;
}

std::vector<instance_record> instance_registry::list() const
{
    std::vector<instance_record> records;

    std::error_code ec;
    fs::directory_iterator it(m_instances_dir, ec);
    if (ec)
    {
        if (ec != std::errc::no_such_file_or_directory)
            LOG_WARNF("cannot list %s: %s", m_instances_dir.c_str(), ec.message().c_str());
        return records;
    }

    for (const auto& entry : it)
    {
        std::string fname = entry.path().filename().string();
        if (fname.empty() || fname[0] == '.' || !entry.is_directory(ec))
            continue;

        instance_record rec;
        if (auto r = read_record(entry.path(), rec); !r)
        {
            LOG_WARNF("skipping instance %s: %s", fname.c_str(), r.message.c_str());
            continue;
        }
        records.push_back(std::move(rec));
    }

    std::sort(records.begin(), records.end(),
        [](const instance_record& a, const instance_record& b) { return a.name < b.name; });
    return records;
}

// Caller holds m_claim_mutex
op_result instance_registry::check_ports(instance_record& record, std::string_view excluding) const
{
    auto records = list();

    if (auto r = port_allocator::reserve(record.port, records, excluding); !r)
        return r;

    if (auto* t = record.tunnel())
    {
        // The new listening port must not collide with our own cover port either
        bool reassign = t->cover_site_port == 0 || t->cover_site_port == record.port ||
                        port_allocator::is_claimed(t->cover_site_port, records, excluding);
        if (reassign)
        {
            t->cover_site_port = port_allocator::pick_cover_port(record.port, records, excluding);
            if (t->cover_site_port == 0)
                return op_result::fail(err_port_conflict, "no free port for the cover site");
        }
    }
    return op_result::ok();
}

op_result instance_registry::create(instance_record& record)
{
    if (auto r = validate_record(record); !r)
        return r;

    std::lock_guard<std::mutex> lock(m_claim_mutex);

    instance_layout layout(m_instances_dir, record.name);
    std::error_code ec;
    if (fs::exists(layout.dir(), ec))
        return op_result::fail(err_name_conflict, "instance '" + record.name + "' already exists");

    if (auto r = check_ports(record, {}); !r)
        return r;

    record.created_at = iso8601_now();
    record.updated_at.clear();

    // Build the directory under a hidden name, then publish it with one rename
    fs::path staging = m_instances_dir / (std::string(staging_prefix) + record.name + "-" + unique_suffix());
    instance_layout staged(m_instances_dir, staging.filename().string());

    auto discard = [&staging](op_result r) {
        std::error_code rm_ec;
        fs::remove_all(staging, rm_ec);
        return r;
    };

    if (auto r = ensure_directory(staging, 0750, m_owner); !r)
        return discard(std::move(r));
    if (auto r = ensure_directory(staged.logs_dir(), 0750, m_owner); !r)
        return discard(std::move(r));
    if (auto r = ensure_directory(staged.run_dir(), 0750, m_owner); !r)
        return discard(std::move(r));
    if (auto r = write_file_atomic(staged.record(), format_json(record), 0640, m_owner); !r)
        return discard(std::move(r));

    fs::rename(staging, layout.dir(), ec);
    if (ec)
        return discard(op_result::fail(err_io, "publish " + layout.dir().string() + ": " + ec.message()));

    LOG_INFOF("registered instance %s (%s, port %u)",
        record.name.c_str(), kind_to_string(record.kind()), static_cast<unsigned>(record.port));
    return op_result::ok();
}

op_result instance_registry::update(instance_record& record)
{
    if (auto r = validate_record(record); !r)
        return r;

    instance_record current;
    if (auto r = get(record.name, current); !r)
        return r;

    record.created_at = current.created_at;
    record.updated_at = iso8601_now();

    instance_layout layout(m_instances_dir, record.name);

    bool ports_changed = record.claimed_ports() != current.claimed_ports() ||
                         (record.tunnel() && record.tunnel()->cover_site_port == 0);
    if (!ports_changed)
        return write_file_atomic(layout.record(), format_json(record), 0640, m_owner);

    std::lock_guard<std::mutex> lock(m_claim_mutex);
    if (auto r = check_ports(record, record.name); !r)
        return r;
    return write_file_atomic(layout.record(), format_json(record), 0640, m_owner);
}

op_result instance_registry::remove(std::string_view name)
{
    if (auto r = validate_name(name); !r)
        return r;

    instance_layout layout(m_instances_dir, name);

    std::error_code ec;
    if (!fs::exists(layout.dir(), ec))
        return op_result::fail(err_not_found, "instance '" + std::string(name) + "' not found");

    // Rename first so the record disappears in one step, then delete
    fs::path doomed = m_instances_dir / (std::string(removing_prefix) + std::string(name) + "-" + unique_suffix());
    fs::rename(layout.dir(), doomed, ec);
    if (ec)
        return op_result::fail(err_io, "remove " + layout.dir().string() + ": " + ec.message());

    fs::remove_all(doomed, ec);
    if (ec)
        return op_result::fail(err_io, "remove " + doomed.string() + ": " + ec.message());

    LOG_INFOF("removed instance %.*s", static_cast<int>(name.size()), name.data());
    return op_result::ok();
}
