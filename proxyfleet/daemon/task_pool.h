#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of worker threads running queued tasks in FIFO order
class task_pool
{
public:
    explicit task_pool(size_t workers);
    ~task_pool();

    task_pool(const task_pool&) = delete;
    task_pool& operator=(const task_pool&) = delete;

    // Returns false once stop() has been called
    bool submit(std::function<void()> task);

    // Runs what is already queued, then joins the workers
    void stop();

private:
    void worker_loop();

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_queue;
    bool m_stopping = false;
    std::vector<std::thread> m_threads;
};
