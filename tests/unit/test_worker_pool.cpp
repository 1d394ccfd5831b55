#include "WorkerPool.h"
#include <iostream>
#include <cassert>
#include <vector>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

using namespace DriveSync;

void test_transfers_run_in_parallel() {
    std::cout << "Running test_transfers_run_in_parallel..." << std::endl;
    WorkerPool pool("transfers", 4);
    assert(pool.size() == 4);
    assert(pool.name() == "transfers");

    // Stands in for per-file copies fanned out by the synchronizer
    const int fileCount = 100;
    std::atomic<int> copied{0};
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < fileCount; ++i) {
        futures.push_back(pool.submit([&]() {
            int now = ++inFlight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            --inFlight;
            copied++;
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    assert(copied == fileCount);
    assert(peak <= 4);
    pool.waitIdle();
    assert(pool.completed() == static_cast<uint64_t>(fileCount));
    std::cout << "test_transfers_run_in_parallel passed." << std::endl;
}

void test_failed_task_reports_through_future() {
    std::cout << "Running test_failed_task_reports_through_future..." << std::endl;
    WorkerPool pool("transfers", 1);

    auto failing = pool.submit([]() {
        throw std::runtime_error("copy failed");
    });

    bool caught = false;
    try {
        failing.get();
    } catch (const std::runtime_error& e) {
        caught = std::string(e.what()) == "copy failed";
    }
    assert(caught);

    // The worker keeps serving after a failed task
    std::atomic<bool> after{false};
    pool.submit([&after]() { after = true; }).get();
    assert(after);
    pool.waitIdle();
    assert(pool.completed() == 2);

    std::cout << "test_failed_task_reports_through_future passed." << std::endl;
}

void test_pending_counts_queued_and_running() {
    std::cout << "Running test_pending_counts_queued_and_running..." << std::endl;
    WorkerPool pool("schedules", 1);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> started{false};
    pool.submit([gate, &started]() {
        started = true;
        gate.wait();
    });
    pool.submit([]() {});

    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(pool.pending() == 2);

    release.set_value();
    pool.waitIdle();
    assert(pool.pending() == 0);
    assert(pool.completed() == 2);

    std::cout << "test_pending_counts_queued_and_running passed." << std::endl;
}

void test_close_finishes_queue_and_rejects_more() {
    std::cout << "Running test_close_finishes_queue_and_rejects_more..." << std::endl;
    WorkerPool pool("schedules", 1);

    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        pool.submit([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            done++;
        });
    }
    pool.close();
    assert(done == 10);
    assert(!pool.isOpen());

    bool rejected = false;
    try {
        pool.submit([]() {});
    } catch (const PoolClosed& e) {
        rejected = std::string(e.what()).find("schedules") != std::string::npos;
    }
    assert(rejected);

    // Closing twice is harmless
    pool.close();
    std::cout << "test_close_finishes_queue_and_rejects_more passed." << std::endl;
}

int main() {
    try {
        test_transfers_run_in_parallel();
        test_failed_task_reports_through_future();
        test_pending_counts_queued_and_running();
        test_close_finishes_queue_and_rejects_more();
        std::cout << "All WorkerPool tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
