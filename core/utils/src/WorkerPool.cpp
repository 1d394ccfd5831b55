#include "WorkerPool.h"
#include "LoggerMacros.h"

#include <algorithm>

namespace DriveSync {

namespace {
const char* kComponent = "WorkerPool";
}

WorkerPool::WorkerPool(std::string name, std::size_t workers) : name_(std::move(name)) {
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workerCount_ = workers;
    threads_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads_.emplace_back(&WorkerPool::run, this);
    }
    LOG_DEBUG_COMP_IF("Pool '" + name_ + "' started " + std::to_string(workers) + " worker(s)", kComponent);
}

WorkerPool::~WorkerPool() {
    close();
}

void WorkerPool::push(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            throw PoolClosed(name_);
        }
        queue_.push_back(std::move(task));
    }
    workReady_.notify_one();
}

void WorkerPool::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        workReady_.wait(lock, [this]() { return !queue_.empty() || !open_; });
        if (queue_.empty()) {
            return;
        }

        std::function<void()> task = std::move(queue_.front());
        queue_.pop_front();
        running_++;

        lock.unlock();
        // Exceptions are captured by the packaged_task into the caller's future
        task();
        lock.lock();

        running_--;
        completed_++;
        if (queue_.empty() && running_ == 0) {
            settled_.notify_all();
        }
    }
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    settled_.wait(lock, [this]() { return queue_.empty() && running_ == 0; });
}

void WorkerPool::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return;
        }
        open_ = false;
    }
    workReady_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    LOG_DEBUG_COMP_IF("Pool '" + name_ + "' closed after " + std::to_string(completed()) + " task(s)", kComponent);
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + running_;
}

uint64_t WorkerPool::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

bool WorkerPool::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

} // namespace DriveSync
