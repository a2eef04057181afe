/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "jobmgr/types.hpp"

namespace jobmgr {

struct OutputResult {
    bool ok = false;
    std::string text;
    JobError error = JobError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class OutputSink {
public:
    static constexpr const char* kErrorSeparator = "\n--- Errors ---\n";

    explicit OutputSink(const std::filesystem::path& home) noexcept;

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;
    OutputSink(OutputSink&&) noexcept = default;
    OutputSink& operator=(OutputSink&&) noexcept = default;

    [[nodiscard]] Result write(JobUid uid, const std::string& out, const std::string& err) const noexcept;
    [[nodiscard]] OutputResult read(JobUid uid) const noexcept;
    [[nodiscard]] bool exists(JobUid uid) const noexcept;

    bool remove(JobUid uid) const noexcept;
    [[nodiscard]] Result clear() const noexcept;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return outputDir_; }
    [[nodiscard]] std::filesystem::path pathFor(JobUid uid) const;

private:
    std::filesystem::path outputDir_;
};

}
