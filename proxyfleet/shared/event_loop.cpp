#include "event_loop.h"
#include <unistd.h>
#include <cerrno>
#include <fcntl.h>
#include <sys/socket.h>

event_loop::event_loop(uint32_t queue_depth)
    : m_running(false), m_queue_depth(queue_depth), m_pending_submissions(0)
{
}

event_loop::~event_loop()
{
    if (m_ring_ready)
        io_uring_queue_exit(&m_ring);

    if (m_signal_pipe[0] >= 0) close(m_signal_pipe[0]);
    if (m_signal_pipe[1] >= 0) close(m_signal_pipe[1]);
}

bool event_loop::setup_signal_pipe()
{
    // Non-blocking so a signal handler never stalls on a full pipe
    if (pipe2(m_signal_pipe, O_NONBLOCK | O_CLOEXEC) < 0)
        return false;

    m_signal_req = { nullptr, &m_signal_buf, m_signal_pipe[0], 1, op_read };

    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (!sqe)
        return false;

    io_uring_prep_read(sqe, m_signal_pipe[0], &m_signal_buf, 1, 0);
    io_uring_sqe_set_data(sqe, &m_signal_req);
    io_uring_submit(&m_ring);
    return true;
}

// Get an SQE, flushing once if the ring is full
struct io_uring_sqe* event_loop::get_sqe()
{
    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (__builtin_expect(!sqe, 0))
    {
        io_uring_submit(&m_ring);
        m_pending_submissions = 0;
        sqe = io_uring_get_sqe(&m_ring);
    }
    return sqe;
}

bool event_loop::init()
{
    if (io_uring_queue_init(m_queue_depth, &m_ring, 0) < 0)
        return false;
    m_ring_ready = true;

    return setup_signal_pipe();
}

void event_loop::run()
{
    m_running.store(true, std::memory_order_release);

    struct io_uring_cqe* cqe;

    while (m_running.load(std::memory_order_relaxed))
    {
        if (m_pending_submissions > 0)
        {
            io_uring_submit_and_wait(&m_ring, 1);
            m_pending_submissions = 0;
        }

        if (io_uring_peek_cqe(&m_ring, &cqe) != 0)
        {
            int rc = io_uring_wait_cqe(&m_ring, &cqe);
            if (rc == -EINTR)
                continue;
            if (rc < 0)
                break;
        }

        unsigned head;
        unsigned count = 0;
        bool got_signal = false;

        io_uring_for_each_cqe(&m_ring, head, cqe)
        {
            count++;

            auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));

            if (req == &m_signal_req)
            {
                got_signal = true;
                break;
            }

            if (req != nullptr && req->owner != nullptr)
                req->owner->on_cqe(cqe);
        }

        io_uring_cq_advance(&m_ring, count);

        if (got_signal)
        {
            m_running.store(false, std::memory_order_release);
            break;
        }
    }
}

int event_loop::get_signal_write_fd() const
{
    return m_signal_pipe[1];
}

void event_loop::submit_accept(int listen_fd, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_accept(sqe, listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_read(int fd, char* buf, uint32_t len, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_recv(sqe, fd, buf, len, 0);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_write(int fd, const char* buf, uint32_t len, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    // MSG_NOSIGNAL: a client that hung up must not raise SIGPIPE
    io_uring_prep_send(sqe, fd, buf, len, MSG_NOSIGNAL);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_timeout(struct __kernel_timespec* ts, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_timeout(sqe, ts, 0, 0);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}

void event_loop::submit_fd_read(int fd, char* buf, uint32_t len, io_request* req)
{
    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe) return;

    io_uring_prep_read(sqe, fd, buf, len, 0);
    io_uring_sqe_set_data(sqe, req);
    m_pending_submissions++;
}
