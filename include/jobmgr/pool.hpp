/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "jobmgr/types.hpp"

namespace jobmgr {

using JobProcessor = std::function<void(JobUid, int workerId)>;

// Fixed set of worker threads; at most workerCount() jobs execute at once,
// the rest wait in FIFO order.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    void stop() noexcept;
    [[nodiscard]] bool submit(JobUid uid) noexcept;

    // Blocks until the queue is empty and no worker is busy.
    void waitIdle();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int activeCount() const noexcept { return active_.load(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> active_{0};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::condition_variable idle_;
    std::queue<JobUid> jobQueue_;

    std::vector<std::thread> workerThreads_;
};

}
