#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <sys/types.h>

#include "../shared/file_util.h"
#include "instance.h"
#include "manager_config.h"

class config_generator;
class certificate_manager;
class auth_store;

struct process_snapshot
{
    instance_status status = status_stopped;
    pid_t pid = 0;
    std::chrono::system_clock::time_point started_at{};
    std::string last_error;
};

// Owns every daemon process. The process table maps instance name to its
// live child; nothing else forks, signals or reaps them.
//
// Each instance has an exclusive lock. The plain start/stop/restart
// overloads take it themselves; composite operations acquire() it once and
// pass the held lock to the overloads that take one.
class process_supervisor
{
public:
    // Held or attempted per-instance lock. The lock entry lives only while
    // some instance_lock refers to it, so names that were never registered
    // (or were removed) leave nothing behind.
    class instance_lock
    {
    public:
        instance_lock() = default;
        ~instance_lock();

        instance_lock(instance_lock&& other) noexcept;
        instance_lock& operator=(instance_lock&& other) noexcept;

        instance_lock(const instance_lock&) = delete;
        instance_lock& operator=(const instance_lock&) = delete;

        bool owns_lock() const { return m_lock.owns_lock(); }

    private:
        friend class process_supervisor;
        instance_lock(process_supervisor* supervisor, std::string name, std::unique_lock<std::mutex> lock);

        void release();

        process_supervisor* m_supervisor = nullptr;
        std::string m_name;
        std::unique_lock<std::mutex> m_lock;
    };

    process_supervisor(const manager_config& cfg, const config_generator& generator,
                       certificate_manager& certs, auth_store& auth, file_owner owner);
    ~process_supervisor();

    process_supervisor(const process_supervisor&) = delete;
    process_supervisor& operator=(const process_supervisor&) = delete;

    instance_lock acquire(std::string_view name);
    instance_lock try_acquire(std::string_view name);

    // Idempotent: a live tracked process is left alone and reported as success
    op_result start(const instance_record& record);
    op_result start(const instance_record& record, instance_lock& held);

    // Graceful signal, bounded wait, then SIGKILL. Idempotent.
    op_result stop(std::string_view name);
    op_result stop(std::string_view name, instance_lock& held);

    op_result restart(const instance_record& record);
    op_result restart(const instance_record& record, instance_lock& held);

    // Renders the daemon config and creates missing cert, credential and
    // cover artifacts. Run by start(); also used to refresh a stopped
    // instance's files after an update.
    op_result prepare(const instance_record& record);

    // Reaps tracked processes that died on their own and marks them as
    // failed. Instances whose lock is held are skipped this round.
    void check_processes();

    // Stops every tracked process (manager shutdown)
    void stop_all();

    // Drops the table entry of a removed instance
    void forget(std::string_view name);

    process_snapshot snapshot(std::string_view name) const;
    bool is_running(std::string_view name) const;
    size_t running_count() const;

    // Records a failure reason. A live tracked process stays tracked so a
    // later stop() still reaches it.
    void mark_error(std::string_view name, std::string reason);

    // Lock entries currently alive (held or waited on)
    size_t lock_count() const;

private:
    struct process_entry
    {
        pid_t pid = 0;
        proxy_kind kind = proxy_forward;
        instance_status status = status_stopped;
        std::chrono::system_clock::time_point started_at{};
        std::string last_error;
    };

    op_result spawn(const instance_record& record, pid_t& pid_out);
    op_result wait_ready(const instance_record& record, pid_t pid);
    void kill_and_reap(pid_t pid);

    std::vector<std::string> build_argv(const instance_record& record) const;

    void set_entry(const std::string& name, process_entry entry);
    op_result fail(const std::string& name, std::string reason);

    struct lock_slot
    {
        std::mutex mutex;
        size_t refs = 0;
    };

    std::mutex& retain_lock(std::string_view name);
    void release_lock(const std::string& name);

    const manager_config& m_cfg;
    const config_generator& m_generator;
    certificate_manager& m_certs;
    auth_store& m_auth;
    file_owner m_owner;

    mutable std::mutex m_locks_mutex;
    std::unordered_map<std::string, std::unique_ptr<lock_slot>> m_locks;

    mutable std::mutex m_table_mutex;
    std::unordered_map<std::string, process_entry> m_table;
};

// "exited with code N" / "killed by signal N (NAME)"
std::string describe_wait_status(int status);

// Whether a TCP listener could bind host:port right now
bool port_is_bindable(uint16_t port, const char* host = "0.0.0.0");
