/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <sys/types.h>

namespace jobmgr {

struct RunResult {
    bool ok = false;        // child was spawned and reaped
    int exitCode = -1;
    int termSignal = 0;     // non-zero if the child was killed by a signal
    std::string output;     // captured stdout
    std::string error;      // captured stderr
    std::string message;    // spawn failure detail when !ok

    [[nodiscard]] bool succeeded() const noexcept { return ok && termSignal == 0 && exitCode == 0; }
};

// Called with the child's pid right after spawn, before any wait.
using SpawnCallback = std::function<void(pid_t)>;

// Runs `<shell> -c <command>` in a working directory.
// The child leads its own process group, inherits the environment and reads
// stdin from /dev/null; stdout and stderr are captured in full.
class Runner final {
public:
    explicit Runner(std::string shell);

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;
    Runner(Runner&&) = delete;
    Runner& operator=(Runner&&) = delete;

    [[nodiscard]] RunResult run(const std::string& command,
                                const std::filesystem::path& workdir,
                                const SpawnCallback& onSpawn = {}) const;

    [[nodiscard]] const std::string& shell() const noexcept { return shell_; }

private:
    std::string shell_;

    static void drain(int outFd, int errFd, std::string& out, std::string& err);
    [[nodiscard]] static bool reap(pid_t pid, RunResult& result);
};

}
