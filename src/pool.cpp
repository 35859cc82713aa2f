/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/pool.hpp"
#include "devcat/logger.hpp"
#include <string>

namespace devcat {

Pool::Pool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(TaskProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid task processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }

    taskAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();

    // Drop tasks nobody picked up
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        inFlight_ -= taskQueue_.size();
        while (!taskQueue_.empty()) {
            taskQueue_.pop();
        }
    }
    idle_.notify_all();

    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(std::size_t task) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit task " + std::to_string(task) + " to stopped pool");
                return false;
            }
            taskQueue_.push(task);
            ++inFlight_;
        }

        taskAvailable_.notify_one();
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue task " + std::to_string(task));
        return false;
    }
}

void Pool::waitIdle() noexcept {
    try {
        std::unique_lock<std::mutex> lock(queueMutex_);
        idle_.wait(lock, [this] { return inFlight_ == 0; });
    } catch (...) {
        LOG_ERROR("Pool wait interrupted");
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return taskQueue_.size();
    } catch (...) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_TRACE("Worker thread started");

    try {
        while (true) {
            std::size_t task = 0;

            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                taskAvailable_.wait(lock, [this] {
                    return !taskQueue_.empty() || shutdown_.load();
                });

                if (shutdown_.load()) {
                    break;
                }

                task = taskQueue_.front();
                taskQueue_.pop();
            }

            try {
                processor_(task, workerId);
            } catch (const std::exception& e) {
                LOG_ERROR("Task " + std::to_string(task) + " failed: " + std::string(e.what()));
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                --inFlight_;
                if (inFlight_ == 0) {
                    idle_.notify_all();
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker " + std::to_string(workerId) + " fatal error: " + std::string(e.what()));
    }

    LOG_TRACE("Worker thread stopped");
}

}
