#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace DriveSync {

/**
 * @brief Thrown by WorkerPool::submit() once the pool is closed
 */
class PoolClosed : public std::runtime_error {
public:
    explicit PoolClosed(const std::string& pool)
        : std::runtime_error("Worker pool '" + pool + "' is closed") {}
};

/**
 * @brief Named set of worker threads running tasks in submission order.
 *
 * The Synchronizer fans per-file transfers out over one pool per run
 * ("transfers"); the ScheduledController runs fired schedules on its own
 * ("schedules"). pending() counts queued plus running tasks, so an owner
 * can report or wait for outstanding work. close() stops intake, lets
 * every queued task finish and joins the workers; the destructor closes.
 */
class WorkerPool {
public:
    /// @param workers Thread count; 0 means hardware concurrency
    WorkerPool(std::string name, std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @return future that becomes ready when the task has run; it rethrows
     *         whatever the task threw
     * @throws PoolClosed after close()
     */
    template<typename F>
    std::future<void> submit(F&& func) {
        auto task = std::make_shared<std::packaged_task<void()>>(std::forward<F>(func));
        std::future<void> done = task->get_future();
        push([task]() { (*task)(); });
        return done;
    }

    /// Blocks until nothing is queued or running
    void waitIdle();

    void close();

    const std::string& name() const { return name_; }
    std::size_t size() const { return workerCount_; }
    std::size_t pending() const;
    uint64_t completed() const;
    bool isOpen() const;

private:
    void push(std::function<void()> task);
    void run();

    const std::string name_;
    std::size_t workerCount_ = 0;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable workReady_;
    std::condition_variable settled_;
    std::deque<std::function<void()>> queue_;
    std::size_t running_ = 0;
    uint64_t completed_ = 0;
    bool open_ = true;
};

} // namespace DriveSync
