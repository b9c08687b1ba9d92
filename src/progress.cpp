/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/progress.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace cascade {

namespace {
const char* const kAttemptsHeader = "job_id\ttier\tthreads\toutcome\tpeak_mib\texit_code\tseconds";

const Category kAllCategories[] = {
    Category::Pending, Category::Tier1Failed, Category::Tier2Failed, Category::Tier3Failed,
    Category::Succeeded, Category::SucceededDegraded, Category::Skipped};

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}
}

const char* categoryToString(Category category) noexcept {
    switch (category) {
        case Category::Pending: return "pending";
        case Category::Tier1Failed: return "tier1_failed";
        case Category::Tier2Failed: return "tier2_failed";
        case Category::Tier3Failed: return "tier3_failed";
        case Category::Succeeded: return "succeeded";
        case Category::SucceededDegraded: return "succeeded_degraded";
        case Category::Skipped: return "skipped";
        default: return "unknown";
    }
}

std::optional<Category> categoryFromString(const std::string& text) noexcept {
    for (Category c : kAllCategories) {
        if (text == categoryToString(c)) {
            return c;
        }
    }
    return std::nullopt;
}

std::vector<JobId> ProgressStore::pendingSet(const std::vector<JobId>& all) const {
    std::vector<JobId> pending;
    for (const auto& id : all) {
        if (!isResolved(id)) {
            pending.push_back(id);
        }
    }
    return pending;
}

FileProgressStore::FileProgressStore(const std::filesystem::path& studyDir, const std::string& stage)
    : studyDir_(studyDir), stage_(stage) {
}

std::filesystem::path FileProgressStore::pathFor(Category category) const {
    return studyDir_ / (stage_ + "_" + categoryToString(category) + ".txt");
}

std::filesystem::path FileProgressStore::attemptsPath() const {
    return studyDir_ / (stage_ + "_attempts.tsv");
}

std::filesystem::path FileProgressStore::statePath() const {
    return studyDir_ / (stage_ + "_run.state");
}

std::string FileProgressStore::runState() const {
    std::ifstream file(statePath());
    std::string state;
    if (file) {
        std::getline(file, state);
    }
    return trim(state);
}

std::string FileProgressStore::formatAttempt(const AttemptRecord& record) {
    std::ostringstream oss;
    oss << record.jobId << '\t' << tierNumber(record.tier) << '\t' << record.threads << '\t'
        << outcomeToString(record.outcome) << '\t';
    if (record.peakMemoryMiB) {
        oss << *record.peakMemoryMiB;
    } else {
        oss << "NA";
    }
    oss << '\t' << record.exitCode << '\t' << std::fixed << std::setprecision(1) << record.seconds;
    return oss.str();
}

std::optional<AttemptRecord> FileProgressStore::parseAttempt(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream in(line);
    std::string field;
    while (std::getline(in, field, '\t')) {
        fields.push_back(field);
    }
    if (fields.size() != 7 || fields[0] == "job_id") {
        return std::nullopt;
    }

    try {
        AttemptRecord record;
        record.jobId = fields[0];
        int tier = std::stoi(fields[1]);
        if (tier < 1 || tier > 3) {
            return std::nullopt;
        }
        record.tier = static_cast<Tier>(tier);
        record.threads = std::stoi(fields[2]);
        if (fields[3] == "success") {
            record.outcome = Outcome::Success;
        } else if (fields[3] == "failure") {
            record.outcome = Outcome::Failure;
        } else if (fields[3] == "cancelled") {
            record.outcome = Outcome::Cancelled;
        } else {
            return std::nullopt;
        }
        if (fields[4] != "NA") {
            record.peakMemoryMiB = std::stoll(fields[4]);
        }
        record.exitCode = std::stoi(fields[5]);
        record.seconds = std::stod(fields[6]);
        return record;
    } catch (const std::exception& e) {
        LOG_DEBUG("Malformed attempt line: " + line + " (" + e.what() + ")");
        return std::nullopt;
    }
}

void FileProgressStore::loadLocked() {
    lists_.clear();
    attempts_.clear();

    for (Category c : kAllCategories) {
        std::ifstream file(pathFor(c));
        std::string line;
        auto& list = lists_[c];
        while (std::getline(file, line)) {
            line = trim(line);
            if (!line.empty() && list.ids.insert(line).second) {
                list.order.push_back(line);
            }
        }
    }

    std::ifstream log(attemptsPath());
    std::string line;
    while (std::getline(log, line)) {
        if (auto record = parseAttempt(line)) {
            attempts_.push_back(*record);
        }
    }
}

bool FileProgressStore::load() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        loadLocked();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load progress for " + stage_ + ": " + std::string(e.what()));
        return false;
    }
}

bool FileProgressStore::begin(bool fresh) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        std::filesystem::create_directories(studyDir_, ec);
        if (ec) {
            LOG_ERROR("Cannot create " + studyDir_.string() + ": " + ec.message());
            return false;
        }

        std::string previous = runState();
        if (!fresh && previous == "running") {
            loadLocked();
            resumed_ = true;
            LOG_INFO("Resuming interrupted " + stage_ + " run (" +
                     std::to_string(attempts_.size()) + " attempts on record)");
        } else {
            lists_.clear();
            attempts_.clear();
            resumed_ = false;
            for (Category c : kAllCategories) {
                std::ofstream file(pathFor(c), std::ios::trunc);
                if (!file) {
                    LOG_ERROR("Cannot write " + pathFor(c).string());
                    return false;
                }
            }
            std::ofstream log(attemptsPath(), std::ios::trunc);
            if (!log) {
                LOG_ERROR("Cannot write " + attemptsPath().string());
                return false;
            }
            log << kAttemptsHeader << '\n';
        }

        return writeState("running");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to begin progress for " + stage_ + ": " + std::string(e.what()));
        return false;
    }
}

bool FileProgressStore::writeState(const std::string& state) {
    auto tmp = statePath();
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            LOG_ERROR("Cannot write " + tmp.string());
            return false;
        }
        file << state << '\n';
        file.flush();
        if (!file.good()) {
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, statePath(), ec);
    if (ec) {
        LOG_ERROR("Cannot update " + statePath().string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileProgressStore::appendUnique(Category category, const JobId& jobId) {
    auto& list = lists_[category];
    if (!list.ids.insert(jobId).second) {
        return true;
    }
    list.order.push_back(jobId);

    std::ofstream file(pathFor(category), std::ios::app);
    if (!file) {
        LOG_ERROR("Cannot append to " + pathFor(category).string());
        return false;
    }
    file << jobId << '\n';
    return file.good();
}

bool FileProgressStore::markPending(const std::vector<JobId>& jobs) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        bool ok = true;
        for (const auto& id : jobs) {
            ok = appendUnique(Category::Pending, id) && ok;
        }
        return ok;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record pending jobs: " + std::string(e.what()));
        return false;
    }
}

bool FileProgressStore::markSkipped(const JobId& jobId, bool degraded) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        bool ok = appendUnique(Category::Skipped, jobId);
        if (degraded) {
            ok = appendUnique(Category::SucceededDegraded, jobId) && ok;
        }
        return ok;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record skipped job " + jobId + ": " + std::string(e.what()));
        return false;
    }
}

bool FileProgressStore::rewriteLocked(Category category) {
    auto tmp = pathFor(category);
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            LOG_ERROR("Cannot write " + tmp.string());
            return false;
        }
        for (const auto& id : lists_[category].order) {
            file << id << '\n';
        }
        if (!file.good()) {
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, pathFor(category), ec);
    if (ec) {
        LOG_ERROR("Cannot update " + pathFor(category).string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileProgressStore::reopen(const JobId& jobId) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        bool ok = true;
        for (Category c : kAllCategories) {
            auto& list = lists_[c];
            if (list.ids.erase(jobId) == 0) {
                continue;
            }
            list.order.erase(std::remove(list.order.begin(), list.order.end(), jobId), list.order.end());
            ok = rewriteLocked(c) && ok;
        }
        return ok;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to reopen " + jobId + ": " + std::string(e.what()));
        return false;
    }
}

bool FileProgressStore::append(const AttemptRecord& record) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        attempts_.push_back(record);

        bool ok = true;
        {
            std::ofstream log(attemptsPath(), std::ios::app);
            if (!log) {
                LOG_ERROR("Cannot append to " + attemptsPath().string());
                ok = false;
            } else {
                log << formatAttempt(record) << '\n';
            }
        }

        if (record.outcome == Outcome::Success) {
            ok = appendUnique(Category::Succeeded, record.jobId) && ok;
            if (record.tier == Tier::Three) {
                ok = appendUnique(Category::SucceededDegraded, record.jobId) && ok;
            }
        } else if (record.outcome == Outcome::Failure) {
            Category failed = record.tier == Tier::One   ? Category::Tier1Failed
                              : record.tier == Tier::Two ? Category::Tier2Failed
                                                         : Category::Tier3Failed;
            ok = appendUnique(failed, record.jobId) && ok;
        }
        return ok;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record attempt for " + record.jobId + ": " + std::string(e.what()));
        return false;
    }
}

bool FileProgressStore::finish(bool complete) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return writeState(complete ? "complete" : "running");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finish progress for " + stage_ + ": " + std::string(e.what()));
        return false;
    }
}

bool FileProgressStore::hasLocked(Category category, const JobId& jobId) const {
    auto it = lists_.find(category);
    return it != lists_.end() && it->second.ids.count(jobId) > 0;
}

Resolution FileProgressStore::resolution(const JobId& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hasLocked(Category::SucceededDegraded, jobId)) return Resolution::SucceededDegraded;
    if (hasLocked(Category::Succeeded, jobId)) return Resolution::Succeeded;
    if (hasLocked(Category::Skipped, jobId)) return Resolution::Skipped;
    if (hasLocked(Category::Tier3Failed, jobId)) return Resolution::Failed;
    return Resolution::Unresolved;
}

bool FileProgressStore::isResolved(const JobId& jobId) const {
    return resolution(jobId) != Resolution::Unresolved;
}

Tier FileProgressStore::resumeTier(const JobId& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hasLocked(Category::Tier2Failed, jobId)) return Tier::Three;
    if (hasLocked(Category::Tier1Failed, jobId)) return Tier::Two;
    return Tier::One;
}

std::vector<JobId> FileProgressStore::list(Category category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lists_.find(category);
    return it == lists_.end() ? std::vector<JobId>{} : it->second.order;
}

std::vector<AttemptRecord> FileProgressStore::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

}
