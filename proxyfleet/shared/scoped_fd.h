#pragma once
#include <unistd.h>
#include <utility>

// RAII wrapper for file descriptors (sockets, pipes, temp files)
class scoped_fd
{
public:
    scoped_fd() noexcept : m_fd(-1) {}
    explicit scoped_fd(int fd) noexcept : m_fd(fd) {}

    ~scoped_fd() { reset(); }

    scoped_fd(const scoped_fd&) = delete;
    scoped_fd& operator=(const scoped_fd&) = delete;

    scoped_fd(scoped_fd&& other) noexcept : m_fd(other.release()) {}

    scoped_fd& operator=(scoped_fd&& other) noexcept
    {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    int get() const noexcept { return m_fd; }
    explicit operator bool() const noexcept { return m_fd >= 0; }

    int release() noexcept
    {
        return std::exchange(m_fd, -1);
    }

    void reset(int fd = -1) noexcept
    {
        if (m_fd >= 0)
            ::close(m_fd);
        m_fd = fd;
    }

    // Close now and report the result; needed where close() can surface
    // a deferred write error (temp files before rename).
    bool close_checked() noexcept
    {
        int fd = release();
        return fd < 0 || ::close(fd) == 0;
    }

private:
    int m_fd;
};
