#pragma once
#include <atomic>
#include <cstdint>
#include <liburing.h>

#include "event_loop_definitions.h"

// Single-threaded io_uring loop. Submissions are queued and flushed once per
// iteration; completions are routed to the io_request's owner.
class event_loop
{
public:
    explicit event_loop(uint32_t queue_depth = 256);
    ~event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    bool init();
    void run();
    int get_signal_write_fd() const;

    // Batched submissions - these queue SQEs without submitting
    void submit_accept(int listen_fd, io_request* req);
    void submit_read(int fd, char* buf, uint32_t len, io_request* req);
    void submit_write(int fd, const char* buf, uint32_t len, io_request* req);
    void submit_timeout(struct __kernel_timespec* ts, io_request* req);

    // Plain read() for non-socket fds (eventfd)
    void submit_fd_read(int fd, char* buf, uint32_t len, io_request* req);

private:
    struct io_uring_sqe* get_sqe();
    bool setup_signal_pipe();

    struct io_uring m_ring{};
    bool m_ring_ready{false};
    std::atomic<bool> m_running;
    uint32_t m_queue_depth;
    uint32_t m_pending_submissions{0};
    int m_signal_pipe[2]{-1, -1};
    io_request m_signal_req{};
    char m_signal_buf{};
};
