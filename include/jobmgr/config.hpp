/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

namespace jobmgr {

struct Config {
    std::filesystem::path home;                       // JOBMGR_HOME, default ~/.jobmgr
    int workers = 10;                                 // JOBMGR_WORKERS
    std::chrono::milliseconds pollInterval{10'000};   // JOBMGR_POLL_INTERVAL (seconds)
    std::string shell = "/bin/sh";                    // SHELL

    [[nodiscard]] static Config fromEnv();
    [[nodiscard]] static Config forHome(const std::filesystem::path& home);

    [[nodiscard]] std::filesystem::path logFile() const { return home / "jobmgr.log"; }
};

}
