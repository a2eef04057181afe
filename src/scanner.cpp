/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/scanner.hpp"
#include "jobmgr/job_store.hpp"
#include "jobmgr/logger.hpp"

namespace jobmgr {

Scanner::Scanner(const JobStore& store) noexcept : store_(store) {
}

std::vector<JobUid> Scanner::scan() const {
    std::vector<JobUid> jobs;

    ListResult listed = store_.list();
    if (!listed) {
        // Corruption is reported on every cycle until someone fixes the files
        LOG_ERROR("Scanner cannot read job store: " + listed.message);
        return jobs;
    }

    for (const auto& job : listed.jobs) {
        if (job.status == Status::Pending) {
            jobs.push_back(job.uid);
            LOG_TRACE("Found pending job " + std::to_string(job.id) + " (uid " + std::to_string(job.uid) + ")");
        }
    }

    if (!jobs.empty()) {
        LOG_DEBUG("Scanner found " + std::to_string(jobs.size()) + " pending jobs");
    }
    return jobs;
}

std::size_t Scanner::pendingCount() const {
    return scan().size();
}

}
