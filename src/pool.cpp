/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/pool.hpp"
#include "jobmgr/logger.hpp"

namespace jobmgr {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
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
        // Queued jobs are dropped; they were never claimed and stay PENDING
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
        std::queue<JobUid>().swap(jobQueue_);
    }

    jobAvailable_.notify_all();
    idle_.notify_all();

    // In-flight jobs run to completion
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();
    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(JobUid uid) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: uid " + std::to_string(uid));
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push(uid);
        }

        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: uid " + std::to_string(uid));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job uid " + std::to_string(uid) + ": " + e.what());
        return false;
    }
}

void Pool::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idle_.wait(lock, [this] {
        return shutdown_.load() || (jobQueue_.empty() && active_.load() == 0);
    });
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_TRACE("Worker-" + std::to_string(workerId) + " thread started");

    while (true) {
        JobUid uid = 0;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            uid = jobQueue_.front();
            jobQueue_.pop();
            // Counted under the queue lock so waitIdle never sees an empty queue with the job in neither place
            active_.fetch_add(1);
        }

        LOG_DEBUG("Worker-" + std::to_string(workerId) + " picked job uid " + std::to_string(uid));

        try {
            processor_(uid, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " job processing error: " +
                      std::string(e.what()) + " (uid " + std::to_string(uid) + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            active_.fetch_sub(1);
        }
        idle_.notify_all();
    }

    LOG_TRACE("Worker " + std::to_string(workerId) + " stopped");
}

}
