/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/output_sink.hpp"
#include "jobmgr/logger.hpp"
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace jobmgr {

OutputSink::OutputSink(const std::filesystem::path& home) noexcept
    : outputDir_(home / "output") {
}

std::filesystem::path OutputSink::pathFor(JobUid uid) const {
    return outputDir_ / ("job_" + std::to_string(uid) + ".txt");
}

Result OutputSink::write(JobUid uid, const std::string& out, const std::string& err) const noexcept {
    try {
        std::filesystem::create_directories(outputDir_);

        auto finalPath = pathFor(uid);
        auto tempPath = finalPath;
        tempPath += ".tmp." + std::to_string(::getpid());

        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                return Result::failure(JobError::IoError, "Failed to open " + tempPath.string());
            }
            file << out;
            if (!err.empty()) {
                file << kErrorSeparator << err;
            }
            file.flush();
            if (!file.good()) {
                std::error_code ec;
                std::filesystem::remove(tempPath, ec);
                return Result::failure(JobError::IoError, "Failed to write " + tempPath.string());
            }
        }

        // Readers see either the previous file or the complete new one
        std::filesystem::rename(tempPath, finalPath);

        LOG_DEBUG("Output written for job uid " + std::to_string(uid) + " (" +
                  std::to_string(out.size() + err.size()) + " bytes)");
        return Result::success();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write output for job uid " + std::to_string(uid) + ": " + e.what());
        return Result::failure(JobError::IoError, e.what());
    } catch (...) {
        return Result::failure(JobError::IoError, "Unknown error writing output");
    }
}

OutputResult OutputSink::read(JobUid uid) const noexcept {
    try {
        auto path = pathFor(uid);
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return {false, "", JobError::NotFound, "No output yet"};
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        return {true, std::move(content), JobError::None, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading output for job uid " + std::to_string(uid) + ": " + e.what());
        return {false, "", JobError::IoError, e.what()};
    } catch (...) {
        return {false, "", JobError::IoError, "Unknown error reading output"};
    }
}

bool OutputSink::exists(JobUid uid) const noexcept {
    try {
        return std::filesystem::exists(pathFor(uid));
    } catch (...) {
        return false;
    }
}

bool OutputSink::remove(JobUid uid) const noexcept {
    try {
        std::error_code ec;
        return std::filesystem::remove(pathFor(uid), ec);
    } catch (...) {
        return false;
    }
}

Result OutputSink::clear() const noexcept {
    try {
        if (!std::filesystem::exists(outputDir_)) {
            return Result::success();
        }
        for (const auto& entry : std::filesystem::directory_iterator(outputDir_)) {
            if (entry.is_regular_file()) {
                std::filesystem::remove(entry.path());
            }
        }
        return Result::success();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to clear output directory: " + std::string(e.what()));
        return Result::failure(JobError::IoError, e.what());
    } catch (...) {
        return Result::failure(JobError::IoError, "Unknown error clearing output");
    }
}

}
