#include "thread_pool.h"

#include <algorithm>

namespace cl {

size_t calculateThreadCount(ParallelismTier tier, unsigned hardwareThreads) {
    size_t hw = hardwareThreads == 0 ? 4 : hardwareThreads;

    size_t wanted = hw;
    if (tier == ParallelismTier::Auto) {
        wanted = hw * 6 / 10;
    } else if (tier == ParallelismTier::Fixed) {
        wanted = hw * 9 / 10;
    }
    return std::clamp(wanted, size_t(1), MAX_POOL_THREADS);
}

ThreadPool::ThreadPool(size_t numThreads) {
    size_t count = std::max(size_t(1), numThreads);
    m_workers.reserve(count);
    while (m_workers.size() < count) {
        m_workers.emplace_back(&ThreadPool::run, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_stopping) {
        return false;
    }
    m_queue.push_back(std::move(task));
    lock.unlock();
    m_wake.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_stopping = true;
    }
    m_wake.notify_all();

    for (std::thread& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::run() {
    for (;;) {
        std::function<void()> next;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            // Stopping only exits once the backlog is gone
            if (m_queue.empty()) {
                return;
            }
            next = std::move(m_queue.front());
            m_queue.pop_front();
        }
        if (next) {
            next();
        }
    }
}

} // namespace cl
