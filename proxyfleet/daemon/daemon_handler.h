#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <liburing.h>

#include "../shared/event_loop_definitions.h"
#include "../shared/op_result.h"
#include "../cli/arg_parser.h"

class event_loop;
class proxy_manager;
class task_pool;

struct ipc_connection
{
    uint64_t id;
    int fd;
    io_request read_req;
    io_request write_req;
    char read_buf[4096];
    std::string write_buf;
    size_t write_off = 0;
    std::string partial;

    // A command from this connection is running on a worker
    bool busy = false;
};

// IPC front end of the daemon. Lines arrive on the unix socket through the
// event loop; each command runs on the task pool so a slow start or stop
// never blocks the loop. Results come back through an eventfd.
class daemon_handler : public io_handler
{
public:
    daemon_handler(proxy_manager& manager, event_loop& loop, task_pool& pool);
    ~daemon_handler() override;

    daemon_handler(const daemon_handler&) = delete;
    daemon_handler& operator=(const daemon_handler&) = delete;

    bool setup();
    void teardown();
    void on_cqe(struct io_uring_cqe* cqe) override;

    // Periodic process check, 0 disables it
    void set_monitor_interval(std::chrono::milliseconds interval);

    // Runs one command line synchronously. Returns the status byte
    // (0 ok, 1 bad request, 2 failure); `out` gets the reply text.
    int execute(std::string_view line, std::string& out);

    // Another daemon already answers on socket_path
    static bool is_running();

    static std::string socket_path;

private:
    struct command_result
    {
        int fd;
        uint64_t conn_id;
        int exit_code;
        std::string text;
    };

    void handle_accept(struct io_uring_cqe* cqe);
    void handle_read(struct io_uring_cqe* cqe, io_request* req);
    void handle_write(struct io_uring_cqe* cqe, io_request* req);
    void handle_notify(struct io_uring_cqe* cqe);
    void handle_timeout();

    void dispatch_next(ipc_connection* conn);
    void close_connection(int fd);
    void arm_monitor();

    int cmd_create(const parsed_args& pa, std::string& out);
    int cmd_lifecycle(const parsed_args& pa, std::string& out);
    int cmd_update(const parsed_args& pa, std::string& out);
    int cmd_ls(const parsed_args& pa, std::string& out);
    int cmd_show(const parsed_args& pa, std::string& out);
    int cmd_user(const parsed_args& pa, std::string& out);
    int cmd_cert(const parsed_args& pa, std::string& out);
    int cmd_logs(const parsed_args& pa, std::string& out);
    int cmd_test(const parsed_args& pa, std::string& out);
    int cmd_ovpn(const parsed_args& pa, std::string& out);

    static int exit_code_for(const op_result& r);
    static int report(const op_result& r, std::string& out);

    void send_response(ipc_connection* conn, int exit_code, std::string text);

    proxy_manager& m_manager;
    event_loop& m_loop;
    task_pool& m_pool;

    int m_listen_fd;
    io_request m_accept_req;

    std::unordered_map<int, std::unique_ptr<ipc_connection>> m_clients;
    uint64_t m_next_conn_id = 1;

    int m_event_fd;
    io_request m_notify_req;
    uint64_t m_notify_buf = 0;

    std::mutex m_results_mutex;
    std::vector<command_result> m_results;

    std::chrono::milliseconds m_monitor_interval{0};
    struct __kernel_timespec m_monitor_ts{};
    io_request m_monitor_req;
    std::atomic<bool> m_monitor_pending{false};
};
