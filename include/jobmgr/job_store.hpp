/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "jobmgr/output_sink.hpp"
#include "jobmgr/types.hpp"

namespace jobmgr {

struct AddResult {
    bool ok = false;
    JobId id = 0;
    JobUid uid = 0;
    JobError error = JobError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct ListResult {
    bool ok = false;
    std::vector<JobRecord> jobs;
    JobError error = JobError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct LookupResult {
    bool ok = false;
    JobRecord job;
    JobError error = JobError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Persistent job table: jobs.txt and status.txt, positionally aligned.
//
// Every operation runs as one transaction under an flock() on .store.lock:
// shared for reads, exclusive for the whole read-modify-write of a mutation.
// The lock is taken on a fresh descriptor per transaction, so it serializes
// worker threads of one process as well as separate CLI processes.
// A failed mutation never rewrites either file.
class JobStore final {
public:
    static constexpr char kFieldDelimiter = '\x1f';

    // Delivers a signal to a live job's pid; the status change is stored only if it succeeds.
    using SignalFn = std::function<Result(pid_t)>;

    explicit JobStore(const std::filesystem::path& home, bool createIfMissing = true);

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;
    JobStore(JobStore&&) noexcept = default;
    JobStore& operator=(JobStore&&) noexcept = default;

    [[nodiscard]] AddResult add(const std::string& command, const std::filesystem::path& workdir);
    [[nodiscard]] ListResult list() const;
    [[nodiscard]] LookupResult get(JobId id) const;
    [[nodiscard]] LookupResult getByUid(JobUid uid) const;

    [[nodiscard]] Result updateStatus(JobId id, Status status);
    [[nodiscard]] Result updateStatusByUid(JobUid uid, Status status);

    // PENDING -> RUNNING; fails if another worker or process got there first.
    // Returns the record as claimed, read in the same transaction.
    [[nodiscard]] LookupResult claim(JobUid uid);
    [[nodiscard]] Result bindPid(JobUid uid, pid_t pid);
    [[nodiscard]] Result signalLive(JobId id, Status next, const SignalFn& deliver);

    [[nodiscard]] Result remove(JobId id);
    [[nodiscard]] Result removeAll();
    [[nodiscard]] Result removeFinished();

    [[nodiscard]] const std::filesystem::path& home() const noexcept { return home_; }
    [[nodiscard]] const OutputSink& outputs() const noexcept { return outputs_; }

private:
    struct Table {
        std::vector<JobRecord> rows;
        JobUid nextUid = 1;
    };
    using Mutation = std::function<Result(Table&)>;

    std::filesystem::path home_;
    std::filesystem::path jobsPath_;
    std::filesystem::path statusPath_;
    std::filesystem::path nextIdPath_;
    std::filesystem::path lockPath_;
    OutputSink outputs_;

    [[nodiscard]] bool createHome(bool createIfMissing) noexcept;
    [[nodiscard]] static bool isValidField(const std::string& value) noexcept;

    [[nodiscard]] Result snapshot(Table& table) const noexcept;
    [[nodiscard]] Result transact(const Mutation& mutation) noexcept;
    [[nodiscard]] Result load(Table& table) const;
    [[nodiscard]] Result save(const Table& table) const;

    [[nodiscard]] Result setStatus(JobRecord& row, Status status) const;
    [[nodiscard]] static JobRecord* findUid(Table& table, JobUid uid) noexcept;
};

}
