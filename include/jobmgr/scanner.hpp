/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <vector>

#include "jobmgr/types.hpp"

namespace jobmgr {

class JobStore;

class Scanner {
public:
    explicit Scanner(const JobStore& store) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    // Uids of PENDING jobs in store order. Empty if the store cannot be read.
    [[nodiscard]] std::vector<JobUid> scan() const;
    [[nodiscard]] std::size_t pendingCount() const;

private:
    const JobStore& store_;
};

}
