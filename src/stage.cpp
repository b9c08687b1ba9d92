/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/stage.hpp"
#include "cascade/logger.hpp"
#include <algorithm>

namespace cascade {

bool Stage::checkResources(std::string& error) const {
    (void)error;
    return true;
}

bool Stage::checkAuth(const std::string& auth, std::string& error) const {
    (void)auth;
    (void)error;
    return true;
}

bool Stage::validate(const std::filesystem::path& study, std::string& error) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(study, ec)) {
        error = "study directory not found: " + study.string();
        return false;
    }
    return true;
}

bool Stage::isComplete(const Job& job) const {
    auto outputs = expectedOutputs(job);
    if (outputs.empty()) {
        return false;
    }
    return std::all_of(outputs.begin(), outputs.end(),
                       [](const std::filesystem::path& p) { return isNonEmptyFile(p); });
}

bool Stage::cleanPartialOutput(const Job& job) const {
    std::error_code ec;
    if (!std::filesystem::exists(job.outputDir, ec)) {
        return true;
    }
    std::filesystem::remove_all(job.outputDir, ec);
    if (ec) {
        LOG_ERROR("Failed to remove partial output " + job.outputDir.string() + ": " + ec.message());
        return false;
    }
    LOG_DEBUG("Removed partial output: " + job.outputDir.string());
    return true;
}

std::string Stage::degradedNotice(const Job& job) const {
    return "Job " + job.id + " of stage " + name() +
           " completed only with minimal resources and reduced fidelity.\n";
}

std::vector<std::filesystem::path> listFiles(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec), end;
    while (!ec && it != end) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
        it.increment(ec);
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::filesystem::path> listDirectories(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> dirs;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec), end;
    while (!ec && it != end) {
        if (it->is_directory(ec) && it->path().filename().string()[0] != '.') {
            dirs.push_back(it->path());
        }
        it.increment(ec);
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

bool startsWith(const std::string& value, const std::string& prefix) noexcept {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) noexcept {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isNonEmptyFile(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    auto size = std::filesystem::file_size(path, ec);
    return !ec && size > 0;
}

}
