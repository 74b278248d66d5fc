#include "task_pool.h"

task_pool::task_pool(size_t workers)
{
    if (workers == 0)
        workers = 1;

    m_threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
        m_threads.emplace_back(&task_pool::worker_loop, this);
}

task_pool::~task_pool()
{
    stop();
}

bool task_pool::submit(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping)
            return false;
        m_queue.push_back(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

void task_pool::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();

    for (auto& t : m_threads)
    {
        if (t.joinable())
            t.join();
    }
    m_threads.clear();
}

void task_pool::worker_loop()
{
    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty())
                return;
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }
        task();
    }
}
