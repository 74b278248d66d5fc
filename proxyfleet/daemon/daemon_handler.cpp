#include "daemon_handler.h"
#include "task_pool.h"
#include "../manager/proxy_manager.h"
#include "../manager/ovpn_patcher.h"
#include "../shared/event_loop.h"
#include "../shared/file_util.h"
#include "../shared/json_codec.h"
#include "../shared/logging.h"
#include "../shared/time_format.h"
#include "../cli/command_hashing.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <charconv>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

std::string daemon_handler::socket_path = "/tmp/proxyfleet.sock";

namespace {
    constexpr size_t max_line = 64 * 1024;

    bool parse_int(std::string_view s, int64_t& out)
    {
        if (s.empty())
            return false;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        return ec == std::errc() && ptr == s.data() + s.size();
    }

    int usage(std::string& out, const char* text)
    {
        out = std::string("usage: ") + text + "\n";
        return 1;
    }

    int missing_value(std::string& out, std::string_view flag)
    {
        out = "missing value for " + std::string(flag) + "\n";
        return 1;
    }

    int unknown_flag(std::string& out, std::string_view flag)
    {
        out = "unknown flag: " + std::string(flag) + "\n";
        return 1;
    }

    const char* status_label(instance_status s)
    {
        switch (s)
        {
            case status_initializing: return "Starting";
            case status_running:      return "Running";
            case status_stopped:      return "Stopped";
            case status_error:        return "Error";
        }
        return "Unknown";
    }
}

daemon_handler::daemon_handler(proxy_manager& manager, event_loop& loop, task_pool& pool)
    : m_manager(manager), m_loop(loop), m_pool(pool), m_listen_fd(-1), m_event_fd(-1)
{
    m_accept_req = { this, nullptr, -1, 0, op_accept };
    m_notify_req = { this, reinterpret_cast<char*>(&m_notify_buf), -1, sizeof(m_notify_buf), op_notify };
    m_monitor_req = { this, nullptr, -1, 0, op_timeout };
}

daemon_handler::~daemon_handler()
{
    teardown();
}

void daemon_handler::set_monitor_interval(std::chrono::milliseconds interval)
{
    m_monitor_interval = interval;
}

bool daemon_handler::is_running()
{
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return false;

    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    bool ok = connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return ok;
}

bool daemon_handler::setup()
{
    struct sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path))
    {
        LOG_ERRORF("socket path too long: %s", socket_path.c_str());
        return false;
    }

    unlink(socket_path.c_str());

    m_listen_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_listen_fd < 0)
        return false;

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(m_listen_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        LOG_ERRORF("bind %s: %s", socket_path.c_str(), std::strerror(errno));
        close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }

    // Owner and group only: the socket controls processes
    chmod(socket_path.c_str(), 0660);

    if (listen(m_listen_fd, 16) < 0)
    {
        close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }

    m_event_fd = eventfd(0, EFD_CLOEXEC);
    if (m_event_fd < 0)
    {
        close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }
    m_notify_req.fd = m_event_fd;

    m_loop.submit_accept(m_listen_fd, &m_accept_req);
    m_loop.submit_fd_read(m_event_fd, reinterpret_cast<char*>(&m_notify_buf),
        sizeof(m_notify_buf), &m_notify_req);
    arm_monitor();

    return true;
}

void daemon_handler::teardown()
{
    for (auto& [fd, conn] : m_clients)
        close(fd);
    m_clients.clear();

    if (m_listen_fd >= 0)
    {
        close(m_listen_fd);
        m_listen_fd = -1;
        unlink(socket_path.c_str());
    }

    if (m_event_fd >= 0)
    {
        close(m_event_fd);
        m_event_fd = -1;
    }
}

void daemon_handler::on_cqe(struct io_uring_cqe* cqe)
{
    auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
    if (!req)
        return;

    switch (req->type)
    {
        case op_accept:
            handle_accept(cqe);
            break;
        case op_read:
            handle_read(cqe, req);
            break;
        case op_write:
            handle_write(cqe, req);
            break;
        case op_notify:
            handle_notify(cqe);
            break;
        case op_timeout:
            handle_timeout();
            break;
    }
}

void daemon_handler::arm_monitor()
{
    if (m_monitor_interval.count() <= 0)
        return;

    auto ms = m_monitor_interval.count();
    m_monitor_ts.tv_sec = ms / 1000;
    m_monitor_ts.tv_nsec = (ms % 1000) * 1000000;
    m_loop.submit_timeout(&m_monitor_ts, &m_monitor_req);
}

void daemon_handler::handle_timeout()
{
    // One sweep at a time; a sweep still running skips this tick
    if (!m_monitor_pending.exchange(true))
    {
        bool queued = m_pool.submit([this] {
            m_manager.check_processes();
            m_monitor_pending.store(false);
        });
        if (!queued)
            m_monitor_pending.store(false);
    }
    arm_monitor();
}

void daemon_handler::handle_accept(struct io_uring_cqe* cqe)
{
    int client_fd = cqe->res;

    if (client_fd >= 0)
    {
        auto conn = std::make_unique<ipc_connection>();
        conn->id = m_next_conn_id++;
        conn->fd = client_fd;
        conn->read_req = { this, conn->read_buf, client_fd, sizeof(conn->read_buf), op_read };
        conn->write_req = { this, nullptr, client_fd, 0, op_write };

        auto* ptr = conn.get();
        m_clients[client_fd] = std::move(conn);

        m_loop.submit_read(client_fd, ptr->read_buf, sizeof(ptr->read_buf), &ptr->read_req);
    }
    else if (client_fd != -EAGAIN && client_fd != -EINTR && client_fd != -ECONNABORTED)
    {
        LOG_WARNF("accept: %s", std::strerror(-client_fd));
    }

    if (m_listen_fd >= 0)
        m_loop.submit_accept(m_listen_fd, &m_accept_req);
}

void daemon_handler::close_connection(int fd)
{
    close(fd);
    m_clients.erase(fd);
}

void daemon_handler::handle_read(struct io_uring_cqe* cqe, io_request* req)
{
    int fd = req->fd;
    auto it = m_clients.find(fd);
    if (it == m_clients.end())
        return;

    auto* conn = it->second.get();

    if (cqe->res <= 0)
    {
        close_connection(fd);
        return;
    }

    conn->partial.append(conn->read_buf, cqe->res);

    if (conn->partial.size() > max_line && conn->partial.find('\n') == std::string::npos)
    {
        conn->partial.clear();
        send_response(conn, 1, "command line too long\n");
        return;
    }

    dispatch_next(conn);
}

void daemon_handler::dispatch_next(ipc_connection* conn)
{
    size_t pos;
    while ((pos = conn->partial.find('\n')) != std::string::npos)
    {
        std::string line = conn->partial.substr(0, pos);
        conn->partial.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        conn->busy = true;
        int fd = conn->fd;
        uint64_t id = conn->id;

        bool queued = m_pool.submit([this, fd, id, line = std::move(line)] {
            command_result res{ fd, id, 0, {} };
            res.exit_code = execute(line, res.text);
            {
                std::lock_guard<std::mutex> lock(m_results_mutex);
                m_results.push_back(std::move(res));
            }
            uint64_t one = 1;
            if (::write(m_event_fd, &one, sizeof(one)) < 0)
                LOG_ERRORF("eventfd write: %s", std::strerror(errno));
        });

        if (!queued)
            send_response(conn, 2, "daemon is shutting down\n");
        return;
    }

    m_loop.submit_read(conn->fd, conn->read_buf, sizeof(conn->read_buf), &conn->read_req);
}

void daemon_handler::handle_notify(struct io_uring_cqe* cqe)
{
    if (cqe->res < 0 && cqe->res != -EINTR && cqe->res != -EAGAIN)
    {
        LOG_ERRORF("eventfd read: %s", std::strerror(-cqe->res));
        return;
    }

    std::vector<command_result> ready;
    {
        std::lock_guard<std::mutex> lock(m_results_mutex);
        ready.swap(m_results);
    }

    for (auto& res : ready)
    {
        auto it = m_clients.find(res.fd);
        // The client may have gone away and its fd been reused
        if (it == m_clients.end() || it->second->id != res.conn_id)
            continue;
        send_response(it->second.get(), res.exit_code, std::move(res.text));
    }

    m_loop.submit_fd_read(m_event_fd, reinterpret_cast<char*>(&m_notify_buf),
        sizeof(m_notify_buf), &m_notify_req);
}

void daemon_handler::handle_write(struct io_uring_cqe* cqe, io_request* req)
{
    int fd = req->fd;
    auto it = m_clients.find(fd);
    if (it == m_clients.end())
        return;

    auto* conn = it->second.get();

    if (cqe->res < 0)
    {
        close_connection(fd);
        return;
    }

    conn->write_off += static_cast<size_t>(cqe->res);
    if (conn->write_off < conn->write_buf.size())
    {
        uint32_t left = static_cast<uint32_t>(conn->write_buf.size() - conn->write_off);
        m_loop.submit_write(fd, conn->write_buf.data() + conn->write_off, left, &conn->write_req);
        return;
    }

    conn->write_buf.clear();
    conn->write_off = 0;
    conn->busy = false;
    dispatch_next(conn);
}

void daemon_handler::send_response(ipc_connection* conn, int exit_code, std::string text)
{
    std::string response;
    response.reserve(text.size() + 2);
    response += static_cast<char>(exit_code);
    response += text;
    response += '\0';
    conn->write_buf = std::move(response);
    conn->write_off = 0;
    conn->busy = true;

    conn->write_req.buffer = conn->write_buf.data();
    conn->write_req.length = static_cast<uint32_t>(conn->write_buf.size());

    m_loop.submit_write(conn->fd, conn->write_buf.data(),
        static_cast<uint32_t>(conn->write_buf.size()), &conn->write_req);
}

// ─── Commands ───

int daemon_handler::exit_code_for(const op_result& r)
{
    switch (r.code)
    {
        case err_none:
            return 0;
        case err_validation:
        case err_name_conflict:
        case err_port_conflict:
        case err_not_found:
        case err_duplicate_user:
            return 1;
        case err_process:
        case err_certificate:
        case err_io:
            return 2;
    }
    return 2;
}

int daemon_handler::report(const op_result& r, std::string& out)
{
    if (!r)
        out += r.describe() + "\n";
    return exit_code_for(r);
}

int daemon_handler::execute(std::string_view line, std::string& out)
{
    out.clear();

    parsed_args pa;
    pa.parse(line);

    if (pa.count == 0)
    {
        out = "no command\n";
        return 1;
    }
    if (pa.truncated)
    {
        out = "too many arguments\n";
        return 1;
    }

    switch (pa.hashes[0])
    {
        case fnv1a("create"):  return cmd_create(pa, out);
        case fnv1a("start"):
        case fnv1a("stop"):
        case fnv1a("restart"):
        case fnv1a("remove"):
        case fnv1a("rm"):      return cmd_lifecycle(pa, out);
        case fnv1a("update"):  return cmd_update(pa, out);
        case fnv1a("ls"):      return cmd_ls(pa, out);
        case fnv1a("show"):    return cmd_show(pa, out);
        case fnv1a("user"):    return cmd_user(pa, out);
        case fnv1a("cert"):    return cmd_cert(pa, out);
        case fnv1a("logs"):    return cmd_logs(pa, out);
        case fnv1a("test"):    return cmd_test(pa, out);
        case fnv1a("ovpn"):    return cmd_ovpn(pa, out);
        default:
            out = "unknown command: " + std::string(pa.args[0]) + "\n";
            return 1;
    }
}

int daemon_handler::cmd_create(const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return usage(out, "create <forward|tunnel> <name> -p <port> [flags]");

    create_request req;
    if (!parse_proxy_kind(pa.args[1], req.kind))
    {
        out = "unknown proxy type: " + std::string(pa.args[1]) + "\n";
        return 1;
    }
    req.name = std::string(pa.args[2]);

    bool have_port = false;
    for (size_t i = 3; i < pa.count; ++i)
    {
        switch (pa.hashes[i])
        {
            case fnv1a("-p"):
            case fnv1a("--port"):
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                if (!parse_int(pa.args[++i], req.port))
                {
                    out = "invalid port: " + std::string(pa.args[i]) + "\n";
                    return 1;
                }
                have_port = true;
                break;
            case fnv1a("--https"):
                req.https_enabled = true;
                break;
            case fnv1a("--dpi"):
                req.dpi_evasion_enabled = true;
                break;
            case fnv1a("--forward"):
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                req.forward_address = std::string(pa.args[++i]);
                break;
            case fnv1a("--cover"):
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                req.cover_domain = std::string(pa.args[++i]);
                break;
            case fnv1a("--cn"):
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                req.common_name = std::string(pa.args[++i]);
                break;
            case fnv1a("--user"):
            {
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                std::string_view pair = pa.args[++i];
                size_t colon = pair.find(':');
                if (colon == std::string_view::npos)
                {
                    out = "--user expects <user>:<password>\n";
                    return 1;
                }
                req.users.emplace_back(std::string(pair.substr(0, colon)),
                                       std::string(pair.substr(colon + 1)));
                break;
            }
            case fnv1a("-s"):
            case fnv1a("--start"):
                req.autostart = true;
                break;
            default:
                return unknown_flag(out, pa.args[i]);
        }
    }

    if (!have_port)
        return usage(out, "create <forward|tunnel> <name> -p <port> [flags]");

    instance_record record;
    op_result r = m_manager.create(req, record);
    if (r.code == err_process && !record.name.empty())
        out = "created " + record.name + " but it failed to start\n";
    return report(r, out);
}

int daemon_handler::cmd_lifecycle(const parsed_args& pa, std::string& out)
{
    std::string_view verb = pa.args[0];
    if (pa.count < 2)
    {
        out = "usage: " + std::string(verb) + " <name> [name...]\n";
        return 1;
    }

    int worst = 0;
    for (size_t i = 1; i < pa.count; ++i)
    {
        std::string_view name = pa.args[i];
        op_result r;
        switch (pa.hashes[0])
        {
            case fnv1a("start"):   r = m_manager.start(name);   break;
            case fnv1a("stop"):    r = m_manager.stop(name);    break;
            case fnv1a("restart"): r = m_manager.restart(name); break;
            default:               r = m_manager.remove(name);  break;
        }

        if (!r)
            out += std::string(name) + ": " + r.describe() + "\n";
        worst = std::max(worst, exit_code_for(r));
    }
    return worst;
}

int daemon_handler::cmd_update(const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return usage(out, "update <name> [--port N] [--https|--no-https] [--dpi|--no-dpi] "
                          "[--forward addr] [--cover domain|--no-cover] [--cn name]");

    std::string_view name = pa.args[1];
    update_patch patch;

    for (size_t i = 2; i < pa.count; ++i)
    {
        switch (pa.hashes[i])
        {
            case fnv1a("-p"):
            case fnv1a("--port"):
            {
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                int64_t port;
                if (!parse_int(pa.args[++i], port))
                {
                    out = "invalid port: " + std::string(pa.args[i]) + "\n";
                    return 1;
                }
                patch.port = port;
                break;
            }
            case fnv1a("--https"):     patch.https_enabled = true;        break;
            case fnv1a("--no-https"):  patch.https_enabled = false;       break;
            case fnv1a("--dpi"):       patch.dpi_evasion_enabled = true;  break;
            case fnv1a("--no-dpi"):    patch.dpi_evasion_enabled = false; break;
            case fnv1a("--no-cover"):  patch.cover_domain = std::string(); break;
            case fnv1a("--forward"):
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                patch.forward_address = std::string(pa.args[++i]);
                break;
            case fnv1a("--cover"):
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                patch.cover_domain = std::string(pa.args[++i]);
                break;
            case fnv1a("--cn"):
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                patch.common_name = std::string(pa.args[++i]);
                break;
            default:
                return unknown_flag(out, pa.args[i]);
        }
    }

    instance_record record;
    return report(m_manager.update(name, patch, record), out);
}

int daemon_handler::cmd_ls(const parsed_args& pa, std::string& out)
{
    bool silent = false;
    for (size_t i = 1; i < pa.count; ++i)
    {
        switch (pa.hashes[i])
        {
            case fnv1a("-s"):
            case fnv1a("--silent"): silent = true; break;
            default:
                return unknown_flag(out, pa.args[i]);
        }
    }

    auto instances = m_manager.list();

    std::ostringstream os;
    os << std::left;

    if (!silent)
        os << std::setw(20) << "NAME"
           << std::setw(15) << "TYPE"
           << std::setw(8)  << "PORT"
           << std::setw(10) << "DESIRED"
           << std::setw(20) << "STATUS"
           << "CREATED\n";

    for (const auto& ii : instances)
    {
        std::string status = ii.process.status == status_running
            ? format_uptime(ii.process.started_at)
            : status_label(ii.process.status);

        os << std::setw(20) << ii.record.name
           << std::setw(15) << kind_to_string(ii.record.kind())
           << std::setw(8)  << ii.record.port
           << std::setw(10) << desired_to_string(ii.record.desired)
           << std::setw(20) << status
           << ii.record.created_at << "\n";
    }

    out = os.str();
    return 0;
}

int daemon_handler::cmd_show(const parsed_args& pa, std::string& out)
{
    if (pa.count != 2)
        return usage(out, "show <name>");

    instance_info ii;
    if (auto r = m_manager.info(pa.args[1], ii); !r)
        return report(r, out);

    const auto& rec = ii.record;

    json_object_writer w;
    w.field("name", rec.name)
     .field("proxy_type", kind_to_string(rec.kind()))
     .field("port", static_cast<int>(rec.port));

    if (auto* f = rec.forward())
    {
        w.field("https_enabled", f->https_enabled)
         .field("dpi_evasion_enabled", f->dpi_evasion_enabled);

        std::string users;
        for (const auto& u : ii.users)
        {
            if (!users.empty())
                users += ',';
            users += u;
        }
        w.field("users", users);
    }
    else if (auto* t = rec.tunnel())
    {
        w.field("forward_address", t->forward_address)
         .field("cover_domain", t->cover_domain)
         .field("cover_site_port", static_cast<int>(t->cover_site_port));
    }

    w.field("desired_state", desired_to_string(rec.desired))
     .field("status", status_to_string(ii.process.status))
     .field("pid", static_cast<int64_t>(ii.process.pid))
     .field("has_certificate", ii.has_certificate)
     .field("created_at", rec.created_at)
     .field("updated_at", rec.updated_at);

    if (!ii.process.last_error.empty())
        w.field("last_error", ii.process.last_error);

    out = w.str();
    return 0;
}

int daemon_handler::cmd_user(const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return usage(out, "user add|rm|ls <name> ...");

    std::string_view name = pa.args[2];

    switch (pa.hashes[1])
    {
        case fnv1a("add"):
        {
            if (pa.count < 5)
                return usage(out, "user add <name> <user> <password>");
            // The password is the rest of the line so it may contain spaces
            return report(m_manager.add_user(name, pa.args[3], pa.rest_from(4)), out);
        }
        case fnv1a("rm"):
        case fnv1a("remove"):
        {
            if (pa.count != 4)
                return usage(out, "user rm <name> <user>");
            return report(m_manager.remove_user(name, pa.args[3]), out);
        }
        case fnv1a("ls"):
        {
            if (pa.count != 3)
                return usage(out, "user ls <name>");
            std::vector<std::string> users;
            if (auto r = m_manager.list_users(name, users); !r)
                return report(r, out);
            for (const auto& u : users)
                out += u + "\n";
            return 0;
        }
        default:
            out = "unknown user command: " + std::string(pa.args[1]) + "\n";
            return 1;
    }
}

int daemon_handler::cmd_cert(const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return usage(out, "cert regen|info <name> ...");

    std::string_view name = pa.args[2];

    switch (pa.hashes[1])
    {
        case fnv1a("regen"):
        {
            cert_params params;
            for (size_t i = 3; i < pa.count; ++i)
            {
                switch (pa.hashes[i])
                {
                    case fnv1a("--cn"):
                        if (i + 1 >= pa.count)
                            return missing_value(out, pa.args[i]);
                        params.common_name = std::string(pa.args[++i]);
                        break;
                    case fnv1a("--days"):
                    case fnv1a("--bits"):
                    {
                        if (i + 1 >= pa.count)
                            return missing_value(out, pa.args[i]);
                        bool days = pa.hashes[i] == fnv1a("--days");
                        int64_t v;
                        if (!parse_int(pa.args[++i], v) || v <= 0 || v > 1000000)
                        {
                            out = "invalid number: " + std::string(pa.args[i]) + "\n";
                            return 1;
                        }
                        (days ? params.validity_days : params.key_size) = static_cast<int>(v);
                        break;
                    }
                    default:
                        return unknown_flag(out, pa.args[i]);
                }
            }
            return report(m_manager.regenerate_cert(name, params), out);
        }
        case fnv1a("info"):
        {
            if (pa.count != 3)
                return usage(out, "cert info <name>");
            cert_info info;
            if (auto r = m_manager.get_cert_info(name, info); !r)
                return report(r, out);

            std::ostringstream os;
            os << "common_name: " << info.common_name << "\n"
               << "not_before:  " << info.not_before << "\n"
               << "not_after:   " << info.not_after << "\n"
               << "key_size:    " << info.key_size << "\n"
               << "serial:      " << info.serial << "\n"
               << "sha256:      " << info.fingerprint << "\n";
            out = os.str();
            return 0;
        }
        default:
            out = "unknown cert command: " + std::string(pa.args[1]) + "\n";
            return 1;
    }
}

int daemon_handler::cmd_logs(const parsed_args& pa, std::string& out)
{
    if (pa.count < 2)
        return usage(out, "logs <name> [daemon|access|cache|error] [-n lines] | logs clear <name>");

    if (pa.hashes[1] == fnv1a("clear") && pa.count == 3)
        return report(m_manager.clear_logs(pa.args[2]), out);

    std::string_view name = pa.args[1];
    std::string_view log = "daemon";
    int64_t lines = 100;

    for (size_t i = 2; i < pa.count; ++i)
    {
        switch (pa.hashes[i])
        {
            case fnv1a("-n"):
            case fnv1a("--lines"):
                if (i + 1 >= pa.count)
                    return missing_value(out, pa.args[i]);
                if (!parse_int(pa.args[++i], lines) || lines < 0)
                {
                    out = "invalid line count: " + std::string(pa.args[i]) + "\n";
                    return 1;
                }
                break;
            default:
                if (pa.args[i][0] == '-')
                    return unknown_flag(out, pa.args[i]);
                log = pa.args[i];
                break;
        }
    }

    return report(m_manager.read_logs(name, log, static_cast<size_t>(lines), out), out);
}

int daemon_handler::cmd_test(const parsed_args& pa, std::string& out)
{
    if (pa.count < 2)
        return usage(out, "test <name> --user u --password p [--url target] | test <name> cover|forward");

    std::string_view name = pa.args[1];
    connectivity_result result;
    op_result r;

    if (pa.count == 3 && (pa.hashes[2] == fnv1a("cover") || pa.hashes[2] == fnv1a("forward")))
    {
        tunnel_check_mode mode = pa.hashes[2] == fnv1a("cover") ? tunnel_check_cover : tunnel_check_forward;
        r = m_manager.test_tunnel(name, mode, result);
    }
    else
    {
        connectivity_request req;
        for (size_t i = 2; i < pa.count; ++i)
        {
            std::string* target = nullptr;
            switch (pa.hashes[i])
            {
                case fnv1a("-u"):
                case fnv1a("--user"):     target = &req.username;   break;
                case fnv1a("--password"): target = &req.password;   break;
                case fnv1a("--url"):      target = &req.target_url; break;
                default:
                    return unknown_flag(out, pa.args[i]);
            }
            if (i + 1 >= pa.count)
                return missing_value(out, pa.args[i]);
            *target = std::string(pa.args[++i]);
        }
        r = m_manager.test_connectivity(name, req, result);
    }

    if (!r)
        return report(r, out);

    out = std::string("status: ") + (result.success ? "success" : "failed") + "\n";
    if (result.http_code != 0)
        out += "http_code: " + std::to_string(result.http_code) + "\n";
    out += "message: " + result.message + "\n";
    return result.success ? 0 : 2;
}

int daemon_handler::cmd_ovpn(const parsed_args& pa, std::string& out)
{
    if (pa.count < 3)
        return usage(out, "ovpn <name> <file.ovpn> [--host h] [--user u --password p]");

    std::string_view name = pa.args[1];
    std::filesystem::path path(pa.args[2]);
    if (!path.is_absolute())
    {
        out = "ovpn: file path must be absolute\n";
        return 1;
    }

    ovpn_request req;
    for (size_t i = 3; i < pa.count; ++i)
    {
        std::string* target = nullptr;
        switch (pa.hashes[i])
        {
            case fnv1a("--host"):     target = &req.host;     break;
            case fnv1a("-u"):
            case fnv1a("--user"):     target = &req.username; break;
            case fnv1a("--password"): target = &req.password; break;
            default:
                return unknown_flag(out, pa.args[i]);
        }
        if (i + 1 >= pa.count)
            return missing_value(out, pa.args[i]);
        *target = std::string(pa.args[++i]);
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return report(op_result::fail(err_not_found, path.string() + " is not a regular file"), out);
    auto size = std::filesystem::file_size(path, ec);
    if (ec)
        return report(op_result::fail(err_io, "stat " + path.string() + ": " + ec.message()), out);
    if (size > max_ovpn_size)
        return report(op_result::fail(err_validation, "file too large (max 1MB)"), out);

    if (auto r = read_file(path, req.content); !r)
        return report(r, out);

    return report(m_manager.patch_ovpn(name, req, out), out);
}
