#include "process_supervisor.h"
#include "auth_store.h"
#include "certificate_manager.h"
#include "config_generator.h"
#include "../shared/file_util.h"
#include "../shared/logging.h"
#include "../shared/scoped_fd.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr auto poll_interval = std::chrono::milliseconds(50);

bool can_connect(uint16_t port)
{
    scoped_fd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd)
        return false;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    return ::connect(fd.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
}

// Last non-empty line of the daemon's output, for error messages
std::string last_log_line(const fs::path& path)
{
    scoped_fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd)
        return {};

    off_t size = ::lseek(fd.get(), 0, SEEK_END);
    if (size <= 0)
        return {};

    off_t start = size > 2048 ? size - 2048 : 0;
    char buf[2048];
    ssize_t n = ::pread(fd.get(), buf, sizeof(buf), start);
    if (n <= 0)
        return {};

    std::string_view tail(buf, static_cast<size_t>(n));
    while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r'))
        tail.remove_suffix(1);
    size_t nl = tail.rfind('\n');
    if (nl != std::string_view::npos)
        tail.remove_prefix(nl + 1);
    return std::string(tail);
}

int graceful_signal(proxy_kind kind)
{
    // nginx finishes open connections on SIGQUIT; SIGTERM is its fast path
    return kind == proxy_tls_tunnel ? SIGQUIT : SIGTERM;
}

} // namespace

std::string describe_wait_status(int status)
{
    if (WIFEXITED(status))
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status))
    {
        int sig = WTERMSIG(status);
        const char* desc = strsignal(sig);
        return "killed by signal " + std::to_string(sig) + (desc ? std::string(" (") + desc + ")" : "");
    }
    return "ended with status " + std::to_string(status);
}

bool port_is_bindable(uint16_t port, const char* host)
{
    scoped_fd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd)
        return false;

    int one = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host, &addr.sin_addr) != 1)
        return false;

    return ::bind(fd.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
}

process_supervisor::process_supervisor(const manager_config& cfg, const config_generator& generator,
                                       certificate_manager& certs, auth_store& auth, file_owner owner)
    : m_cfg(cfg), m_generator(generator), m_certs(certs), m_auth(auth), m_owner(owner)
{
}

process_supervisor::~process_supervisor() = default;

// ─── Locks ───

process_supervisor::instance_lock::instance_lock(process_supervisor* supervisor, std::string name,
                                                 std::unique_lock<std::mutex> lock)
    : m_supervisor(supervisor), m_name(std::move(name)), m_lock(std::move(lock))
{
}

process_supervisor::instance_lock::~instance_lock()
{
    release();
}

process_supervisor::instance_lock::instance_lock(instance_lock&& other) noexcept
    : m_supervisor(std::exchange(other.m_supervisor, nullptr)),
      m_name(std::move(other.m_name)),
      m_lock(std::move(other.m_lock))
{
}

process_supervisor::instance_lock& process_supervisor::instance_lock::operator=(instance_lock&& other) noexcept
{
    if (this != &other)
    {
        release();
        m_supervisor = std::exchange(other.m_supervisor, nullptr);
        m_name = std::move(other.m_name);
        m_lock = std::move(other.m_lock);
    }
    return *this;
}

void process_supervisor::instance_lock::release()
{
    if (!m_supervisor)
        return;
    if (m_lock.owns_lock())
        m_lock.unlock();
    m_lock = std::unique_lock<std::mutex>();
    m_supervisor->release_lock(m_name);
    m_supervisor = nullptr;
}

std::mutex& process_supervisor::retain_lock(std::string_view name)
{
    std::lock_guard<std::mutex> guard(m_locks_mutex);
    auto& slot = m_locks[std::string(name)];
    if (!slot)
        slot = std::make_unique<lock_slot>();
    ++slot->refs;
    return slot->mutex;
}

void process_supervisor::release_lock(const std::string& name)
{
    std::lock_guard<std::mutex> guard(m_locks_mutex);
    auto it = m_locks.find(name);
    if (it != m_locks.end() && --it->second->refs == 0)
        m_locks.erase(it);
}

process_supervisor::instance_lock process_supervisor::acquire(std::string_view name)
{
    std::mutex& m = retain_lock(name);
    return instance_lock(this, std::string(name), std::unique_lock<std::mutex>(m));
}

process_supervisor::instance_lock process_supervisor::try_acquire(std::string_view name)
{
    std::mutex& m = retain_lock(name);
    return instance_lock(this, std::string(name), std::unique_lock<std::mutex>(m, std::try_to_lock));
}

size_t process_supervisor::lock_count() const
{
    std::lock_guard<std::mutex> guard(m_locks_mutex);
    return m_locks.size();
}

// ─── Process table ───

void process_supervisor::set_entry(const std::string& name, process_entry entry)
{
    std::lock_guard<std::mutex> lock(m_table_mutex);
    m_table[name] = std::move(entry);
}

op_result process_supervisor::fail(const std::string& name, std::string reason)
{
    LOG_ERRORF("%s: %s", name.c_str(), reason.c_str());
    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        auto& e = m_table[name];
        e.pid = 0;
        e.status = status_error;
        e.last_error = reason;
    }
    return op_result::fail(err_process, std::move(reason));
}

void process_supervisor::mark_error(std::string_view name, std::string reason)
{
    std::lock_guard<std::mutex> lock(m_table_mutex);
    auto& e = m_table[std::string(name)];
    e.status = status_error;
    e.last_error = std::move(reason);
}

process_snapshot process_supervisor::snapshot(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(m_table_mutex);
    process_snapshot snap;
    auto it = m_table.find(std::string(name));
    if (it == m_table.end())
        return snap;
    snap.status = it->second.status;
    snap.pid = it->second.pid;
    snap.started_at = it->second.started_at;
    snap.last_error = it->second.last_error;
    return snap;
}

bool process_supervisor::is_running(std::string_view name) const
{
    return snapshot(name).status == status_running;
}

size_t process_supervisor::running_count() const
{
    std::lock_guard<std::mutex> lock(m_table_mutex);
    size_t n = 0;
    for (const auto& [name, e] : m_table)
    {
        if (e.status == status_running)
            ++n;
    }
    return n;
}

void process_supervisor::forget(std::string_view name)
{
    std::lock_guard<std::mutex> lock(m_table_mutex);
    m_table.erase(std::string(name));
}

// ─── Artifacts ───

op_result process_supervisor::prepare(const instance_record& record)
{
    instance_layout layout(m_cfg.instances_dir(), record.name);

    if (auto r = ensure_directory(layout.logs_dir(), 0750, m_owner); !r)
        return r;
    if (auto r = ensure_directory(layout.run_dir(), 0750, m_owner); !r)
        return r;

    if (record.kind() == proxy_forward)
    {
        if (auto r = m_auth.ensure_file(record.name); !r)
            return r;
    }

    if (record.needs_certificate())
    {
        cert_params params;
        auto* t = record.tunnel();
        params.common_name = t ? t->cover_domain : record.name;
        if (auto r = m_certs.ensure(record.name, params); !r)
            return r;
    }

    if (auto* t = record.tunnel(); t && !t->cover_domain.empty())
    {
        if (auto r = ensure_directory(layout.cover_dir(), 0755, m_owner); !r)
            return r;
        std::error_code ec;
        if (!fs::exists(layout.cover_page(), ec))
        {
            if (auto r = write_file_atomic(layout.cover_page(), config_generator::default_cover_page(), 0644, m_owner); !r)
                return r;
        }
    }

    std::string conf = m_generator.generate(record, layout);
    return write_file_atomic(layout.config_file(record.kind()), conf, 0640, m_owner);
}

std::vector<std::string> process_supervisor::build_argv(const instance_record& record) const
{
    instance_layout layout(m_cfg.instances_dir(), record.name);
    if (record.kind() == proxy_tls_tunnel)
        return { m_cfg.nginx_binary, "-p", layout.dir().string() + "/", "-c", layout.nginx_conf().string() };
    return { m_cfg.squid_binary, "-N", "-f", layout.squid_conf().string() };
}

// ─── Spawn ───

op_result process_supervisor::spawn(const instance_record& record, pid_t& pid_out)
{
    instance_layout layout(m_cfg.instances_dir(), record.name);

    std::vector<std::string> args = build_argv(record);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    scoped_fd log_fd(::open(layout.daemon_log().c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0640));
    if (!log_fd)
        return op_result::fail(err_io, errno_message(("open " + layout.daemon_log().string()).c_str(), errno));

    scoped_fd null_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!null_fd)
        return op_result::fail(err_io, errno_message("open /dev/null", errno));

    // exec failure reporting: the child writes errno, a successful exec closes it
    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0)
        return op_result::fail(err_process, errno_message("pipe", errno));
    scoped_fd err_read(pipefd[0]);
    scoped_fd err_write(pipefd[1]);

    const std::string work_dir = layout.dir().string();

    pid_t pid = ::fork();
    if (pid < 0)
        return op_result::fail(err_process, errno_message("fork", errno));

    if (pid == 0)
    {
        // Child: async-signal-safe calls only
        ::setsid();

        sigset_t all;
        sigemptyset(&all);
        ::sigprocmask(SIG_SETMASK, &all, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(null_fd.get(), STDIN_FILENO);
        ::dup2(log_fd.get(), STDOUT_FILENO);
        ::dup2(log_fd.get(), STDERR_FILENO);

        if (::chdir(work_dir.c_str()) < 0) {}

        ::execv(argv[0], argv.data());

        int err = errno;
        if (::write(err_write.get(), &err, sizeof(err)) < 0) {}
        ::_exit(127);
    }

    err_write.reset();

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(err_read.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        ::waitpid(pid, nullptr, 0);
        return op_result::fail(err_process,
            errno_message(("exec " + args[0]).c_str(), child_errno));
    }

    pid_out = pid;
    return op_result::ok();
}

void process_supervisor::kill_and_reap(pid_t pid)
{
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
}

op_result process_supervisor::wait_ready(const instance_record& record, pid_t pid)
{
    instance_layout layout(m_cfg.instances_dir(), record.name);
    auto deadline = std::chrono::steady_clock::now() + m_cfg.ready_timeout;

    while (true)
    {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid)
        {
            std::string reason = "daemon " + describe_wait_status(status) + " during startup";
            std::string line = last_log_line(layout.daemon_log());
            if (!line.empty())
                reason += ": " + line;
            return op_result::fail(err_process, std::move(reason));
        }

        if (can_connect(record.port))
            return op_result::ok();

        if (std::chrono::steady_clock::now() >= deadline)
        {
            kill_and_reap(pid);
            return op_result::fail(err_process,
                "daemon did not accept connections on port " + std::to_string(record.port) +
                " within " + std::to_string(m_cfg.ready_timeout.count()) + "ms");
        }

        std::this_thread::sleep_for(poll_interval);
    }
}

// ─── Lifecycle ───

op_result process_supervisor::start(const instance_record& record)
{
    auto lock = acquire(record.name);
    return start(record, lock);
}

op_result process_supervisor::start(const instance_record& record, instance_lock& held)
{
    if (!held.owns_lock())
        return op_result::fail(err_process, "instance lock not held");

    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        auto it = m_table.find(record.name);
        if (it != m_table.end() && it->second.pid > 0)
        {
            pid_t pid = it->second.pid;
            int status = 0;
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == 0)
            {
                it->second.status = status_running;
                return op_result::ok();
            }
            // Died since the last monitor pass
            it->second.pid = 0;
        }

        auto& e = m_table[record.name];
        e.status = status_initializing;
        e.kind = record.kind();
        e.last_error.clear();
    }

    if (auto r = prepare(record); !r)
    {
        mark_error(record.name, r.message);
        LOG_ERRORF("%s: %s", record.name.c_str(), r.describe().c_str());
        return r;
    }

    if (!port_is_bindable(record.port))
        return fail(record.name, "port " + std::to_string(record.port) + " is already in use by another process");

    if (auto* t = record.tunnel(); t && !t->cover_domain.empty() &&
        !port_is_bindable(t->cover_site_port, "127.0.0.1"))
        return fail(record.name, "cover site port " + std::to_string(t->cover_site_port) + " is already in use");

    pid_t pid = 0;
    if (auto r = spawn(record, pid); !r)
        return fail(record.name, r.message);

    if (auto r = wait_ready(record, pid); !r)
        return fail(record.name, r.message);

    process_entry entry;
    entry.pid = pid;
    entry.kind = record.kind();
    entry.status = status_running;
    entry.started_at = std::chrono::system_clock::now();
    set_entry(record.name, std::move(entry));

    LOG_INFOF("%s: started (pid %d, port %u)", record.name.c_str(), static_cast<int>(pid),
        static_cast<unsigned>(record.port));
    return op_result::ok();
}

op_result process_supervisor::stop(std::string_view name)
{
    auto lock = acquire(name);
    return stop(name, lock);
}

op_result process_supervisor::stop(std::string_view name, instance_lock& held)
{
    if (!held.owns_lock())
        return op_result::fail(err_process, "instance lock not held");

    std::string key(name);
    pid_t pid = 0;
    proxy_kind kind = proxy_forward;
    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        auto it = m_table.find(key);
        if (it == m_table.end() || it->second.pid <= 0)
        {
            if (it != m_table.end())
            {
                it->second.status = status_stopped;
                it->second.pid = 0;
            }
            return op_result::ok();
        }
        pid = it->second.pid;
        kind = it->second.kind;
    }

    int sig = graceful_signal(kind);
    ::kill(-pid, sig);

    auto deadline = std::chrono::steady_clock::now() + m_cfg.stop_timeout;
    bool reaped = false;
    while (std::chrono::steady_clock::now() < deadline)
    {
        pid_t r = ::waitpid(pid, nullptr, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD))
        {
            reaped = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (!reaped)
    {
        LOG_WARNF("%s: no exit within %lldms, sending SIGKILL", key.c_str(),
            static_cast<long long>(m_cfg.stop_timeout.count()));
        kill_and_reap(pid);
    }
    else
    {
        // Helpers left in the session
        ::kill(-pid, SIGKILL);
    }

    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        auto& e = m_table[key];
        e.pid = 0;
        e.status = status_stopped;
        e.last_error.clear();
    }

    LOG_INFOF("%s: stopped", key.c_str());
    return op_result::ok();
}

op_result process_supervisor::restart(const instance_record& record)
{
    auto lock = acquire(record.name);
    return restart(record, lock);
}

op_result process_supervisor::restart(const instance_record& record, instance_lock& held)
{
    if (auto r = stop(record.name, held); !r)
        return r;
    return start(record, held);
}

// ─── Monitor ───

void process_supervisor::check_processes()
{
    std::vector<std::pair<std::string, pid_t>> tracked;
    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        for (const auto& [name, e] : m_table)
        {
            if (e.status == status_running && e.pid > 0)
                tracked.emplace_back(name, e.pid);
        }
    }

    for (const auto& [name, pid] : tracked)
    {
        auto lock = try_acquire(name);
        if (!lock.owns_lock())
            continue;

        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == 0)
            continue;

        std::string reason = r == pid ? "daemon " + describe_wait_status(status) + " unexpectedly"
                                      : "daemon process disappeared";

        std::lock_guard<std::mutex> table_lock(m_table_mutex);
        auto it = m_table.find(name);
        if (it == m_table.end() || it->second.pid != pid)
            continue;
        it->second.pid = 0;
        it->second.status = status_error;
        it->second.last_error = reason;
        LOG_WARNF("%s: %s (not restarting)", name.c_str(), reason.c_str());
    }
}

void process_supervisor::stop_all()
{
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        for (const auto& [name, e] : m_table)
        {
            if (e.pid > 0)
                names.push_back(name);
        }
    }

    for (const auto& name : names)
    {
        auto lock = acquire(name);
        if (auto r = stop(name, lock); !r)
            LOG_WARNF("%s: %s", name.c_str(), r.message.c_str());
    }
}
