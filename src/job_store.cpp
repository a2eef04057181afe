/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/job_store.hpp"
#include "jobmgr/daemon_lock.hpp"
#include "jobmgr/logger.hpp"
#include <algorithm>
#include <initializer_list>
#include <cctype>
#include <cerrno>
#include <stdexcept>
#include <fstream>
#include <sstream>
#include <system_error>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace jobmgr {

namespace {

class FileLock final {
public:
    FileLock(const std::filesystem::path& path, int operation) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "open " + path.string());
        }
        while (::flock(fd_, operation) != 0) {
            if (errno != EINTR) {
                int err = errno;
                ::close(fd_);
                throw std::system_error(err, std::generic_category(), "flock " + path.string());
            }
        }
    }
    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

std::vector<std::string> split(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream in(line);
    while (std::getline(in, field, delimiter)) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == delimiter) {
        fields.emplace_back();
    }
    return fields;
}

bool parseNumber(const std::string& text, unsigned long long& value) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        value = std::stoull(text);
        return true;
    } catch (...) {
        return false;
    }
}

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    if (!file) {
        return lines;
    }
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::filesystem::path tempFor(const std::filesystem::path& path) {
    auto tempPath = path;
    tempPath += ".tmp";
    return tempPath;
}

std::filesystem::path writeTemp(const std::filesystem::path& path, const std::string& content) {
    auto tempPath = tempFor(path);
    std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open " + tempPath.string());
    }
    file << content;
    file.flush();
    if (!file.good()) {
        throw std::runtime_error("Failed to write " + tempPath.string());
    }
    return tempPath;
}

void removeTemps(std::initializer_list<std::filesystem::path> paths) {
    for (const auto& path : paths) {
        std::error_code ec;
        std::filesystem::remove(tempFor(path), ec);
    }
}

Result notFound(JobId id) {
    return Result::failure(JobError::NotFound, "Job " + std::to_string(id) + " not found");
}

Result notFoundUid(JobUid uid) {
    return Result::failure(JobError::NotFound, "Job uid " + std::to_string(uid) + " not found");
}

}

JobStore::JobStore(const std::filesystem::path& home, bool createIfMissing)
    : home_(home),
      jobsPath_(home / "jobs.txt"),
      statusPath_(home / "status.txt"),
      nextIdPath_(home / "next_id"),
      lockPath_(home / ".store.lock"),
      outputs_(home) {
    if (!createHome(createIfMissing)) {
        LOG_ERROR("Failed to initialize job store: " + home_.string());
    }
}

bool JobStore::createHome(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(home_)) {
            if (!createIfMissing) {
                return false;
            }
            std::filesystem::create_directories(home_);
        }
        std::filesystem::create_directories(outputs_.directory());

        for (const auto& path : {jobsPath_, statusPath_}) {
            if (!std::filesystem::exists(path)) {
                std::ofstream touch(path, std::ios::app);
            }
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job store: " + std::string(e.what()));
        return false;
    } catch (...) {
        LOG_ERROR("Unknown error creating job store");
        return false;
    }
}

bool JobStore::isValidField(const std::string& value) noexcept {
    return value.find('\n') == std::string::npos &&
           value.find('\r') == std::string::npos &&
           value.find(kFieldDelimiter) == std::string::npos;
}

AddResult JobStore::add(const std::string& command, const std::filesystem::path& workdir) {
    if (command.empty()) {
        return {false, 0, 0, JobError::InvalidContent, "Command is empty"};
    }
    if (!isValidField(command)) {
        return {false, 0, 0, JobError::InvalidContent, "Command must be a single line"};
    }
    if (!workdir.is_absolute() || !isValidField(workdir.string())) {
        return {false, 0, 0, JobError::InvalidContent, "Working directory must be an absolute path"};
    }

    JobId id = 0;
    JobUid uid = 0;
    Result result = transact([&](Table& table) {
        JobRecord row;
        row.uid = table.nextUid++;
        row.command = command;
        row.workdir = workdir;
        row.status = Status::Pending;
        table.rows.push_back(row);
        id = table.rows.size();
        uid = row.uid;
        return Result::success();
    });

    if (!result) {
        LOG_ERROR("Failed to add job: " + result.message);
        return {false, 0, 0, result.error, result.message};
    }

    LOG_INFO("Added job " + std::to_string(id) + " (uid " + std::to_string(uid) + "): " + command);
    return {true, id, uid, JobError::None, ""};
}

ListResult JobStore::list() const {
    Table table;
    Result result = snapshot(table);
    if (!result) {
        return {false, {}, result.error, result.message};
    }
    return {true, std::move(table.rows), JobError::None, ""};
}

LookupResult JobStore::get(JobId id) const {
    Table table;
    Result result = snapshot(table);
    if (!result) {
        return {false, {}, result.error, result.message};
    }
    if (id == 0 || id > table.rows.size()) {
        Result missing = notFound(id);
        return {false, {}, missing.error, missing.message};
    }
    return {true, table.rows[id - 1], JobError::None, ""};
}

LookupResult JobStore::getByUid(JobUid uid) const {
    Table table;
    Result result = snapshot(table);
    if (!result) {
        return {false, {}, result.error, result.message};
    }
    if (JobRecord* row = findUid(table, uid)) {
        return {true, *row, JobError::None, ""};
    }
    Result missing = notFoundUid(uid);
    return {false, {}, missing.error, missing.message};
}

Result JobStore::updateStatus(JobId id, Status status) {
    return transact([&](Table& table) {
        if (id == 0 || id > table.rows.size()) {
            return notFound(id);
        }
        return setStatus(table.rows[id - 1], status);
    });
}

Result JobStore::updateStatusByUid(JobUid uid, Status status) {
    return transact([&](Table& table) {
        JobRecord* row = findUid(table, uid);
        if (!row) {
            return notFoundUid(uid);
        }
        return setStatus(*row, status);
    });
}

LookupResult JobStore::claim(JobUid uid) {
    JobRecord claimed;
    Result result = transact([&](Table& table) {
        JobRecord* row = findUid(table, uid);
        if (!row) {
            return notFoundUid(uid);
        }
        if (row->status != Status::Pending) {
            return Result::failure(JobError::InvalidTransition,
                                   "Job uid " + std::to_string(uid) + " already " + toString(row->status));
        }
        row->status = Status::Running;
        row->pid.reset();
        claimed = *row;
        return Result::success();
    });

    if (!result) {
        return {false, {}, result.error, result.message};
    }
    return {true, std::move(claimed), JobError::None, ""};
}

Result JobStore::bindPid(JobUid uid, pid_t pid) {
    return transact([&](Table& table) {
        JobRecord* row = findUid(table, uid);
        if (!row) {
            return notFoundUid(uid);
        }
        if (!isLive(row->status)) {
            return Result::failure(JobError::InvalidTransition,
                                   "Cannot bind pid to " + std::string(toString(row->status)) + " job");
        }
        row->pid = pid;
        return Result::success();
    });
}

Result JobStore::signalLive(JobId id, Status next, const SignalFn& deliver) {
    return transact([&](Table& table) {
        if (id == 0 || id > table.rows.size()) {
            return notFound(id);
        }
        JobRecord& row = table.rows[id - 1];
        if (!isLive(row.status) || !row.pid) {
            return Result::failure(JobError::NotFound,
                                   "Job " + std::to_string(id) + " has no running process");
        }
        Result delivered = deliver(*row.pid);
        if (!delivered) {
            return delivered;
        }
        return setStatus(row, next);
    });
}

Result JobStore::remove(JobId id) {
    JobUid removedUid = 0;
    Result result = transact([&](Table& table) {
        if (id == 0 || id > table.rows.size()) {
            return notFound(id);
        }
        removedUid = table.rows[id - 1].uid;
        table.rows.erase(table.rows.begin() + static_cast<std::ptrdiff_t>(id - 1));
        return Result::success();
    });

    if (result) {
        outputs_.remove(removedUid);
        LOG_INFO("Deleted job " + std::to_string(id) + " (uid " + std::to_string(removedUid) + ")");
    }
    return result;
}

Result JobStore::removeAll() {
    Result result = transact([&](Table& table) {
        if (DaemonLock(home_).state() == LockState::Running) {
            return Result::failure(JobError::Busy, "Cannot clean while the daemon is running. Stop it first.");
        }
        for (const auto& row : table.rows) {
            if (isLive(row.status)) {
                return Result::failure(JobError::Busy, "Cannot clean while jobs are running or paused.");
            }
        }
        // nextUid is kept so uids are never reused
        table.rows.clear();
        return Result::success();
    });

    if (!result) {
        LOG_WARN("Clean refused: " + result.message);
        return result;
    }

    // Output goes only once the empty table is on disk
    Result cleared = outputs_.clear();
    if (!cleared) {
        LOG_ERROR("Jobs cleaned but output remains: " + cleared.message);
        return cleared;
    }
    LOG_INFO("Cleaned all jobs and output");
    return result;
}

Result JobStore::removeFinished() {
    std::vector<JobUid> removed;
    Result result = transact([&](Table& table) {
        auto finished = std::stable_partition(table.rows.begin(), table.rows.end(),
            [](const JobRecord& row) { return !isTerminal(row.status); });
        for (auto it = finished; it != table.rows.end(); ++it) {
            removed.push_back(it->uid);
        }
        table.rows.erase(finished, table.rows.end());
        return Result::success();
    });

    if (result) {
        for (JobUid uid : removed) {
            outputs_.remove(uid);
        }
        LOG_INFO("Pruned " + std::to_string(removed.size()) + " finished job(s)");
    }
    return result;
}

Result JobStore::setStatus(JobRecord& row, Status status) const {
    if (!isValidTransition(row.status, status)) {
        return Result::failure(JobError::InvalidTransition,
                               std::string("Invalid transition ") + toString(row.status) + " -> " + toString(status));
    }
    row.status = status;
    if (!isLive(status)) {
        row.pid.reset();
    }
    return Result::success();
}

JobRecord* JobStore::findUid(Table& table, JobUid uid) noexcept {
    auto it = std::find_if(table.rows.begin(), table.rows.end(),
                           [uid](const JobRecord& row) { return row.uid == uid; });
    return it == table.rows.end() ? nullptr : &*it;
}

Result JobStore::snapshot(Table& table) const noexcept {
    try {
        FileLock lock(lockPath_, LOCK_SH);
        return load(table);
    } catch (const std::exception& e) {
        LOG_ERROR("Job store read failed: " + std::string(e.what()));
        return Result::failure(JobError::IoError, e.what());
    } catch (...) {
        return Result::failure(JobError::IoError, "Unknown job store read error");
    }
}

Result JobStore::transact(const Mutation& mutation) noexcept {
    try {
        FileLock lock(lockPath_, LOCK_EX);

        Table table;
        Result loaded = load(table);
        if (!loaded) {
            return loaded;
        }

        Result mutated = mutation(table);
        if (!mutated) {
            return mutated;
        }
        return save(table);
    } catch (const std::exception& e) {
        LOG_ERROR("Job store transaction failed: " + std::string(e.what()));
        return Result::failure(JobError::IoError, e.what());
    } catch (...) {
        return Result::failure(JobError::IoError, "Unknown job store error");
    }
}

Result JobStore::load(Table& table) const {
    std::vector<std::string> jobLines = readLines(jobsPath_);
    std::vector<std::string> statusLines = readLines(statusPath_);

    if (jobLines.size() != statusLines.size()) {
        return Result::failure(JobError::Corrupt,
                               "Job store corrupt: " + std::to_string(jobLines.size()) + " jobs but " +
                               std::to_string(statusLines.size()) + " statuses");
    }

    JobUid maxUid = 0;
    table.rows.clear();
    table.rows.reserve(jobLines.size());

    for (std::size_t i = 0; i < jobLines.size(); ++i) {
        const std::string where = " (line " + std::to_string(i + 1) + ")";

        auto fields = split(jobLines[i], kFieldDelimiter);
        unsigned long long uid = 0;
        if (fields.size() != 3 || !parseNumber(fields[0], uid) || uid == 0 || fields[1].empty()) {
            return Result::failure(JobError::Corrupt, "Malformed job record in " + jobsPath_.string() + where);
        }

        auto statusFields = split(statusLines[i], ' ');
        if (statusFields.empty() || statusFields.size() > 2) {
            return Result::failure(JobError::Corrupt, "Malformed status record in " + statusPath_.string() + where);
        }
        auto status = parseStatus(statusFields[0]);
        if (!status) {
            return Result::failure(JobError::Corrupt,
                                   "Unknown status '" + statusFields[0] + "' in " + statusPath_.string() + where);
        }

        JobRecord row;
        row.id = i + 1;
        row.uid = uid;
        row.command = fields[1];
        row.workdir = fields[2];
        row.status = *status;

        if (statusFields.size() == 2) {
            unsigned long long pid = 0;
            if (!isLive(*status) || !parseNumber(statusFields[1], pid) || pid == 0) {
                return Result::failure(JobError::Corrupt, "Malformed pid in " + statusPath_.string() + where);
            }
            row.pid = static_cast<pid_t>(pid);
        }

        maxUid = std::max<JobUid>(maxUid, uid);
        table.rows.push_back(std::move(row));
    }

    table.nextUid = maxUid + 1;
    std::ifstream nextFile(nextIdPath_);
    if (nextFile) {
        std::string text;
        std::getline(nextFile, text);
        unsigned long long next = 0;
        if (!parseNumber(text, next) || next == 0) {
            return Result::failure(JobError::Corrupt, "Malformed counter in " + nextIdPath_.string());
        }
        table.nextUid = std::max<JobUid>(table.nextUid, next);
    }

    return Result::success();
}

Result JobStore::save(const Table& table) const {
    std::ostringstream jobs;
    std::ostringstream statuses;
    for (const auto& row : table.rows) {
        jobs << row.uid << kFieldDelimiter << row.command << kFieldDelimiter << row.workdir.string() << "\n";
        statuses << toString(row.status);
        if (row.pid) {
            statuses << " " << *row.pid;
        }
        statuses << "\n";
    }

    // All temp files are complete before the first rename; readers hold the
    // shared lock and never observe one file replaced without the other.
    std::filesystem::path jobsTemp;
    std::filesystem::path statusTemp;
    std::filesystem::path nextTemp;
    try {
        jobsTemp = writeTemp(jobsPath_, jobs.str());
        statusTemp = writeTemp(statusPath_, statuses.str());
        nextTemp = writeTemp(nextIdPath_, std::to_string(table.nextUid) + "\n");
        // A counter ahead of the table only skips uids, so it goes first
        std::filesystem::rename(nextTemp, nextIdPath_);
    } catch (const std::exception&) {
        removeTemps({jobsPath_, statusPath_, nextIdPath_});
        throw;
    }

    // Hard link to the current jobs file so a failed status rename can be undone
    auto jobsPrevious = jobsPath_;
    jobsPrevious += ".prev";
    std::error_code ec;
    std::filesystem::remove(jobsPrevious, ec);
    std::filesystem::create_hard_link(jobsPath_, jobsPrevious, ec);
    const bool canRestore = !ec;

    try {
        std::filesystem::rename(jobsTemp, jobsPath_);
        std::filesystem::rename(statusTemp, statusPath_);
    } catch (const std::exception&) {
        if (canRestore) {
            std::filesystem::rename(jobsPrevious, jobsPath_, ec);
        }
        removeTemps({jobsPath_, statusPath_});
        throw;
    }

    std::filesystem::remove(jobsPrevious, ec);
    return Result::success();
}

}
