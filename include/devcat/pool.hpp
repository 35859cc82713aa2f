/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace devcat {

// Called with the task index and the worker number.
using TaskProcessor = std::function<void(std::size_t task, int workerId)>;

class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(TaskProcessor processor);
    void stop() noexcept;
    [[nodiscard]] bool submit(std::size_t task) noexcept;

    // Blocks until every submitted task has finished.
    void waitIdle() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    TaskProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::condition_variable idle_;
    std::queue<std::size_t> taskQueue_;
    std::size_t inFlight_ = 0;  // queued plus running

    std::vector<std::thread> workerThreads_;
};

}
