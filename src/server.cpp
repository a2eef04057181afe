/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/server.hpp"
#include "jobmgr/daemon_lock.hpp"
#include "jobmgr/scanner.hpp"
#include "jobmgr/pool.hpp"
#include "jobmgr/processor.hpp"
#include "jobmgr/logger.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace jobmgr {

// Signal handling is done by Daemon, not by Server

Server::Server(const Config& config)
    : config_(config), store_(config.home) {
    LOG_DEBUG("Server created - home: " + config_.home.string() +
              ", workers: " + std::to_string(config_.workers) +
              ", poll interval: " + std::to_string(config_.pollInterval.count()) + "ms");
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting jobmgr server...");

    if (!recoverOrphanedJobs()) {
        LOG_WARN("Some orphaned jobs could not be recovered");
    }

    setThreadName("Main");

    LOG_DEBUG("Home: " + config_.home.string());
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));
    LOG_DEBUG("Shell: " + config_.shell);

    try {
        if (!createComponents()) {
            return false;
        }

        shutdown_.store(false);
        running_.store(true);
        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_INFO("Server started with " + std::to_string(config_.workers) + " workers");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        running_.store(false);
        releaseComponents();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }

    releaseComponents();

    LOG_INFO("Server shutdown complete");
}

std::size_t Server::runOnce() {
    if (running_.load()) {
        LOG_WARN("runOnce called while the scan loop is active");
        return 0;
    }

    // A live daemon already runs up to `workers` jobs; a second pool would double that
    if (DaemonLock(config_.home).state() == LockState::Running) {
        LOG_WARN("Daemon is running; leaving pending jobs to it");
        return 0;
    }

    if (!createComponents()) {
        return 0;
    }

    std::unordered_set<JobUid> submitted;
    std::size_t dispatched = dispatchPending(submitted);
    LOG_INFO("Dispatched " + std::to_string(dispatched) + " pending job(s)");

    pool_->waitIdle();
    releaseComponents();
    return dispatched;
}

bool Server::createComponents() {
    scanner_ = std::make_unique<Scanner>(store_);
    pool_ = std::make_unique<Pool>(config_.workers);
    processor_ = std::make_unique<Processor>(store_, config_.shell);

    if (!pool_->start([this](JobUid uid, int workerId) {
        (void)processor_->process(uid, workerId);
    })) {
        LOG_ERROR("Failed to start worker pool");
        releaseComponents();
        return false;
    }
    return true;
}

void Server::releaseComponents() noexcept {
    // Pool first: its workers still reference the processor
    if (pool_) {
        pool_->stop();
    }
    pool_.reset();
    processor_.reset();
    scanner_.reset();
}

bool Server::recoverOrphanedJobs() noexcept {
    try {
        ListResult listed = store_.list();
        if (!listed) {
            LOG_ERROR("Cannot check for orphaned jobs: " + listed.message);
            return false;
        }

        bool allRecovered = true;
        int recovered = 0;
        for (const auto& job : listed.jobs) {
            // A live job whose process is gone was left behind by a crashed worker
            if (!isLive(job.status) || !job.pid || isProcessAlive(*job.pid)) {
                continue;
            }

            LOG_WARN("Recovering orphaned job " + std::to_string(job.id) + " (pid " +
                     std::to_string(*job.pid) + " is gone)");
            Result written = store_.outputs().write(job.uid, "", "Job process disappeared before completion");
            if (!written) {
                LOG_WARN("Could not record orphan note for job uid " + std::to_string(job.uid) + ": " + written.message);
            }
            Result updated = store_.updateStatusByUid(job.uid, Status::Error);
            if (updated) {
                ++recovered;
            } else {
                LOG_ERROR("Failed to recover job uid " + std::to_string(job.uid) + ": " + updated.message);
                allRecovered = false;
            }
        }

        if (recovered > 0) {
            LOG_INFO("Marked " + std::to_string(recovered) + " orphaned job(s) as ERROR");
        }
        return allRecovered;
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering orphaned jobs: " + std::string(e.what()));
        return false;
    }
}

std::size_t Server::dispatchPending(std::unordered_set<JobUid>& submitted) {
    auto jobs = scanner_->scan();

    // Anything no longer PENDING has been claimed and can never be PENDING again
    std::unordered_set<JobUid> pending(jobs.begin(), jobs.end());
    for (auto it = submitted.begin(); it != submitted.end(); ) {
        if (pending.find(*it) == pending.end()) {
            it = submitted.erase(it);
        } else {
            ++it;
        }
    }

    std::size_t newCount = 0;
    for (JobUid uid : jobs) {
        if (shutdown_.load()) break;

        if (submitted.find(uid) == submitted.end() && pool_->submit(uid)) {
            submitted.insert(uid);
            newCount++;
        }
    }

    if (newCount > 0) {
        LOG_DEBUG("Submitted " + std::to_string(newCount) + " new jobs to pool");
    }
    return newCount;
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    const auto scanInterval = config_.pollInterval;
    const auto tick = std::min<std::chrono::milliseconds>(scanInterval, std::chrono::milliseconds(100));
    std::unordered_set<JobUid> submittedJobs;

    while (!shutdown_.load()) {
        try {
            dispatchPending(submittedJobs);
        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
        }

        auto sleepEnd = std::chrono::steady_clock::now() + scanInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(tick);
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
