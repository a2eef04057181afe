/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/runner.hpp"
#include "jobmgr/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace jobmgr {

namespace {
constexpr std::size_t kReadChunk = 4096;

void closeFd(int& fd) noexcept {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}
}

Runner::Runner(std::string shell) : shell_(std::move(shell)) {
    if (shell_.empty()) {
        shell_ = "/bin/sh";
    }
    LOG_DEBUG("Runner created with shell " + shell_);
}

RunResult Runner::run(const std::string& command,
                      const std::filesystem::path& workdir,
                      const SpawnCallback& onSpawn) const {
    RunResult result;

    std::error_code ec;
    if (!std::filesystem::is_directory(workdir, ec)) {
        result.message = "Working directory does not exist: " + workdir.string();
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    // O_CLOEXEC keeps these ends out of children spawned concurrently by other workers
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.message = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.message = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    // Everything the child touches is prepared before fork
    const std::string dir = workdir.string();
    const char* argv[] = {shell_.c_str(), "-c", command.c_str(), nullptr};

    pid_t pid = ::fork();
    if (pid < 0) {
        result.message = std::string("fork failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        if (::chdir(dir.c_str()) != 0) {
            static const char msg[] = "jobmgr: cannot enter working directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            ::_exit(126);
        }
        ::execve(argv[0], const_cast<char* const*>(argv), environ);
        static const char msg[] = "jobmgr: cannot execute shell\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    // Parent: also set the group so signals to -pid work before the child runs
    ::setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    LOG_DEBUG("Spawned pid " + std::to_string(pid) + ": " + command);

    if (onSpawn) {
        try {
            onSpawn(pid);
        } catch (const std::exception& e) {
            LOG_ERROR("Spawn callback failed for pid " + std::to_string(pid) + ": " + e.what());
        }
    }

    drain(outPipe[0], errPipe[0], result.output, result.error);
    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    if (!reap(pid, result)) {
        return result;
    }

    result.ok = true;
    return result;
}

void Runner::drain(int outFd, int errFd, std::string& out, std::string& err) {
    char buf[kReadChunk];
    bool outOpen = true;
    bool errOpen = true;

    while (outOpen || errOpen) {
        pollfd fds[2];
        int nfds = 0;
        if (outOpen) {
            fds[nfds++] = {outFd, POLLIN, 0};
        }
        if (errOpen) {
            fds[nfds++] = {errFd, POLLIN, 0};
        }

        // Blocks while the job is paused; pause acts on the child only
        int ready = ::poll(fds, static_cast<nfds_t>(nfds), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR(std::string("poll failed: ") + std::strerror(errno));
            return;
        }

        for (int i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            bool isOut = fds[i].fd == outFd;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (isOut ? out : err).append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                // EOF or read error: stream is finished
                (isOut ? outOpen : errOpen) = false;
            }
        }
    }
}

bool Runner::reap(pid_t pid, RunResult& result) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.message = std::string("waitpid failed: ") + std::strerror(errno);
            return false;
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
        result.exitCode = 128 + result.termSignal;
    }
    return true;
}

}
