/*
 * jobmgr - Local Background Job Manager (command-line front end)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/config.hpp"
#include "jobmgr/daemon.hpp"
#include "jobmgr/job_store.hpp"
#include "jobmgr/logger.hpp"
#include "jobmgr/process_controller.hpp"
#include "jobmgr/server.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using namespace jobmgr;

constexpr const char* VERSION = "0.1.0";

namespace {

enum ExitCode : int { kOk = 0, kFailed = 1, kUsage = 2 };

void printUsage(const char* progName) {
    std::cout << "jobmgr - local background job manager v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  add <command...>     Queue a shell command (runs in the current directory)\n";
    std::cout << "  list                 List jobs with their status\n";
    std::cout << "  run                  Run all pending jobs now and wait for them\n";
    std::cout << "  pause <id>           Suspend a running job\n";
    std::cout << "  resume <id>          Continue a paused job\n";
    std::cout << "  view <id>            Show the captured output of a job\n";
    std::cout << "  start [--foreground] Start the daemon\n";
    std::cout << "  stop                 Stop the daemon\n";
    std::cout << "  delete <id>          Remove a job (later ids shift down)\n";
    std::cout << "  clean                Remove all jobs and output (daemon stopped, nothing running)\n";
    std::cout << "  prune                Remove completed and failed jobs\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  JOBMGR_HOME           State directory (default ~/.jobmgr)\n";
    std::cout << "  JOBMGR_WORKERS        Concurrent jobs (default 10)\n";
    std::cout << "  JOBMGR_POLL_INTERVAL  Daemon scan interval in seconds (default 10)\n";
    std::cout << "  JOBMGR_LOG_LEVEL      Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  SHELL                 Shell used to run jobs (default /bin/sh)\n";
}

std::optional<JobId> parseId(const std::string& text) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size() || value <= 0) {
            return std::nullopt;
        }
        return static_cast<JobId>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int report(const Result& result, const std::string& success) {
    if (result) {
        std::cout << (result.message.empty() ? success : result.message) << "\n";
        return kOk;
    }
    std::cerr << "Error: " << result.message << "\n";
    return kFailed;
}

int cmdAdd(JobStore& store, int argc, char* argv[]) {
    std::ostringstream command;
    for (int i = 2; i < argc; ++i) {
        if (i > 2) command << " ";
        command << argv[i];
    }

    AddResult added = store.add(command.str(), std::filesystem::current_path());
    if (!added) {
        std::cerr << "Error: " << added.message << "\n";
        return kFailed;
    }
    std::cout << "Added job " << added.id << ": " << command.str() << "\n";
    return kOk;
}

int cmdList(const JobStore& store) {
    ListResult listed = store.list();
    if (!listed) {
        std::cerr << "Error: " << listed.message << "\n";
        return kFailed;
    }
    if (listed.jobs.empty()) {
        std::cout << "No jobs.\n";
    }
    for (const auto& job : listed.jobs) {
        std::cout << job.id << ". [" << toString(job.status) << "] " << job.command << "\n";
    }
    return kOk;
}

int cmdView(const JobStore& store, JobId id) {
    LookupResult found = store.get(id);
    if (!found) {
        std::cerr << "Error: " << found.message << "\n";
        return kFailed;
    }
    OutputResult output = store.outputs().read(found.job.uid);
    if (!output) {
        if (output.error == JobError::NotFound) {
            std::cout << "No output yet for job " << id << ".\n";
            return kOk;
        }
        std::cerr << "Error: " << output.message << "\n";
        return kFailed;
    }
    std::cout << output.text;
    return kOk;
}

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return kUsage;
    }

    std::string action = argv[1];
    if (action == "-h" || action == "--help") {
        printUsage(argv[0]);
        return kOk;
    }
    if (action == "-v" || action == "--version") {
        std::cout << VERSION << "\n";
        return kOk;
    }

    try {
        Config config = Config::fromEnv();
        JobStore store(config.home);
        Daemon daemon(config);

        if (!Logger::setFile(config.logFile())) {
            std::cerr << "Warning: cannot open log file " << config.logFile() << ", logging to stderr\n";
        }

        const bool needsId = action == "pause" || action == "resume" || action == "view" || action == "delete";
        std::optional<JobId> id;
        if (needsId) {
            if (argc < 3 || !(id = parseId(argv[2]))) {
                std::cerr << "Error: " << action << " requires a positive job id\n";
                return kUsage;
            }
        }

        int code = kOk;
        if (action == "add") {
            if (argc < 3) {
                std::cerr << "Error: add requires a command\n";
                return kUsage;
            }
            code = cmdAdd(store, argc, argv);
        } else if (action == "list") {
            code = cmdList(store);
        } else if (action == "run") {
            if (daemon.isRunning()) {
                std::cerr << "Error: Daemon is running and will pick up pending jobs. Stop it to run them here.\n";
                return kFailed;
            }
            Server server(config);
            std::size_t dispatched = server.runOnce();
            std::cout << "Ran " << dispatched << " pending job(s).\n";
        } else if (action == "pause") {
            ProcessController controller(store);
            code = report(controller.pause(*id), "Paused job " + std::to_string(*id) + ".");
        } else if (action == "resume") {
            ProcessController controller(store);
            code = report(controller.resume(*id), "Resumed job " + std::to_string(*id) + ".");
        } else if (action == "view") {
            code = cmdView(store, *id);
        } else if (action == "start") {
            bool foreground = argc > 2 && std::string(argv[2]) == "--foreground";
            if (foreground) {
                return daemon.runForeground();
            }
            StartResult started = daemon.start();
            if (started) {
                std::cout << started.message << "\n";
            } else {
                std::cerr << started.message << "\n";
                code = kFailed;
            }
        } else if (action == "stop") {
            code = report(daemon.stop(), "Daemon stopped.");
        } else if (action == "delete") {
            code = report(store.remove(*id), "Deleted job " + std::to_string(*id) + ".");
        } else if (action == "clean") {
            code = report(store.removeAll(), "All jobs and output removed.");
        } else if (action == "prune") {
            code = report(store.removeFinished(), "Finished jobs removed.");
        } else {
            std::cerr << "Invalid command: " << action << "\n\n";
            printUsage(argv[0]);
            return kUsage;
        }

        if (!daemon.isRunning()) {
            std::cout << "Daemon is not running. Start it with '" << argv[0] << " start'\n";
        }
        return code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kFailed;
    }
}
