/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <thread>
#include <unordered_set>

#include "jobmgr/config.hpp"
#include "jobmgr/job_store.hpp"

namespace jobmgr {

class Scanner;
class Pool;
class Processor;

// Polls the store for PENDING jobs and feeds them to a bounded worker pool.
class Server final {
public:
    explicit Server(const Config& config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    // Starts the pool and the background scan loop.
    [[nodiscard]] bool start();
    void shutdown() noexcept;

    // One scan and dispatch, then waits for every dispatched job to finish.
    // Returns the number of jobs dispatched; none while a daemon holds the lock.
    std::size_t runOnce();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] JobStore& store() noexcept { return store_; }

private:
    [[nodiscard]] bool createComponents();
    void releaseComponents() noexcept;
    [[nodiscard]] bool recoverOrphanedJobs() noexcept;
    std::size_t dispatchPending(std::unordered_set<JobUid>& submitted);
    void scanLoop();

    Config config_;
    JobStore store_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<Scanner> scanner_;
    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Processor> processor_;

    std::thread scannerThread_;
};

}
