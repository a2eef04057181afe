/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/config.hpp"
#include "jobmgr/logger.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace jobmgr {

namespace {
long env_long(const char* name, long defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        long parsed = std::stol(val);
        if (parsed <= 0) {
            LOG_WARN(std::string(name) + " must be positive, using default " + std::to_string(defv));
            return defv;
        }
        return parsed;
    } catch (...) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::filesystem::path userHome() {
    if (const char* env = std::getenv("HOME"); env && *env) {
        return std::filesystem::path(env);
    }
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir);
    }
    return std::filesystem::current_path();
}
}

Config Config::fromEnv() {
    Config config;

    if (const char* env = std::getenv("JOBMGR_HOME"); env && *env) {
        config.home = std::filesystem::absolute(env);
    } else {
        config.home = userHome() / ".jobmgr";
    }

    config.workers = static_cast<int>(env_long("JOBMGR_WORKERS", config.workers));
    config.pollInterval = std::chrono::seconds(env_long("JOBMGR_POLL_INTERVAL", 10));

    if (const char* shell = std::getenv("SHELL"); shell && *shell) {
        config.shell = shell;
    }

    return config;
}

Config Config::forHome(const std::filesystem::path& home) {
    Config config;
    config.home = home;
    return config;
}

}
