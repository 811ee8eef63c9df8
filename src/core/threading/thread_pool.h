#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace cl {

// How much of the machine a batch run may take. Stored as 0/1/2 in the config.
enum class ParallelismTier {
    Auto = 0,   // 60% of hardware threads
    Fixed = 1,  // 90%
    Expert = 2, // all of them
};

inline constexpr size_t MAX_POOL_THREADS = 64;

// Worker count for a tier, in [1, MAX_POOL_THREADS]. A hardware count of 0
// (unknown) is treated as 4.
size_t calculateThreadCount(ParallelismTier tier,
                            unsigned hardwareThreads = std::thread::hardware_concurrency());

// Fixed-size FIFO worker pool. Shutdown drains the queue before joining.
class ThreadPool {
  public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // False once shutdown has started
    bool enqueue(std::function<void()> task);

    // Queues `fn` and hands back a future for its result (or its exception).
    // nullopt once shutdown has started.
    template <typename F> auto submit(F&& fn) -> std::optional<std::future<std::invoke_result_t<F>>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> future = task->get_future();
        if (!enqueue([task] { (*task)(); })) {
            return std::nullopt;
        }
        return future;
    }

    void shutdown();

    size_t threadCount() const { return m_workers.size(); }

  private:
    void run();

    std::vector<std::thread> m_workers;
    std::deque<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_wake;
    bool m_stopping = false;
};

} // namespace cl
