/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/stages.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <optional>

namespace cascade {

namespace {
const char* const kRawDir = "Raw_data";
const char* const kTrimmedDir = "Trimmed_data";
const std::string kFastqSuffix = ".fastq.gz";
const std::string kR1Suffix = "_1.fastq.gz";
const std::string kR2Suffix = "_2.fastq.gz";

struct RunFiles {
    std::string prefix;
    std::filesystem::path r1;
    std::optional<std::filesystem::path> r2;
};

std::vector<RunFiles> groupRuns(const std::vector<std::filesystem::path>& files) {
    std::vector<RunFiles> runs;
    auto contains = [&](const std::filesystem::path& p) {
        return std::find(files.begin(), files.end(), p) != files.end();
    };

    for (const auto& file : files) {
        std::string name = file.filename().string();
        if (endsWith(name, kR1Suffix)) {
            std::string prefix = name.substr(0, name.size() - kR1Suffix.size());
            auto mate = file.parent_path() / (prefix + kR2Suffix);
            if (contains(mate)) {
                runs.push_back({prefix, file, mate});
                continue;
            }
        } else if (endsWith(name, kR2Suffix)) {
            std::string prefix = name.substr(0, name.size() - kR2Suffix.size());
            if (contains(file.parent_path() / (prefix + kR1Suffix))) {
                continue;
            }
        }
        runs.push_back({name.substr(0, name.size() - kFastqSuffix.size()), file, std::nullopt});
    }
    return runs;
}
}

TrimStage::TrimStage(TrimOptions options) : options_(std::move(options)) {
}

bool TrimStage::validate(const std::filesystem::path& study, std::string& error) const {
    if (!Stage::validate(study, error)) {
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(study / kRawDir, ec)) {
        error = "Raw_data directory not found in " + study.string();
        return false;
    }
    return true;
}

std::vector<Job> TrimStage::discover(const std::filesystem::path& study) const {
    std::vector<Job> jobs;
    std::vector<std::string> empty;

    for (const auto& dir : listDirectories(study / kRawDir)) {
        Job job;
        job.id = dir.filename().string();
        job.sourceDir = dir;
        job.outputDir = study / kTrimmedDir / job.id;
        for (const auto& file : listFiles(dir)) {
            if (endsWith(file.filename().string(), kFastqSuffix)) {
                job.inputs.push_back(file);
            }
        }
        if (job.inputs.empty()) {
            empty.push_back(job.id);
            continue;
        }
        jobs.push_back(std::move(job));
    }

    if (!empty.empty()) {
        LOG_WARN(std::to_string(empty.size()) + " sample directories contain no .fastq.gz files");
        for (const auto& sample : empty) {
            LOG_WARN("  " + sample);
        }
    }
    return jobs;
}

std::vector<std::filesystem::path> TrimStage::expectedOutputs(const Job& job) const {
    std::vector<std::filesystem::path> outputs;
    for (const auto& run : groupRuns(job.inputs)) {
        if (run.r2) {
            outputs.push_back(job.outputDir / ("fastp_" + run.prefix + kR1Suffix));
            outputs.push_back(job.outputDir / ("fastp_" + run.prefix + kR2Suffix));
        } else {
            outputs.push_back(job.outputDir / ("fastp_" + run.prefix + kFastqSuffix));
        }
    }
    return outputs;
}

std::vector<Command> TrimStage::commands(const Job& job, const JobResourceProfile& profile,
                                         const std::filesystem::path& scratch) const {
    (void)scratch;
    std::vector<Command> cmds;
    const auto& out = job.outputDir;

    for (const auto& run : groupRuns(job.inputs)) {
        Command cmd;
        cmd.argv = {"fastp", "-i", run.r1.string()};
        if (run.r2) {
            cmd.argv.insert(cmd.argv.end(), {
                "-I", run.r2->string(),
                "-o", (out / ("fastp_" + run.prefix + kR1Suffix)).string(),
                "-O", (out / ("fastp_" + run.prefix + kR2Suffix)).string()});
        } else {
            cmd.argv.insert(cmd.argv.end(), {
                "-o", (out / ("fastp_" + run.prefix + kFastqSuffix)).string()});
        }
        cmd.argv.insert(cmd.argv.end(), {
            "-h", (out / ("fastp_" + run.prefix + ".html")).string(),
            "-j", (out / ("fastp_" + run.prefix + ".json")).string(),
            "-w", std::to_string(profile.threads),
            "--length_required", std::to_string(options_.lengthRequired)});

        for (const auto& arg : options_.extraArgs) {
            if (profile.fidelity == FidelityMode::Reduced && arg == "--correction") {
                continue;
            }
            if (!run.r2 && arg == "--detect_adapter_for_pe") {
                continue;
            }
            cmd.argv.push_back(arg);
        }
        cmds.push_back(std::move(cmd));
    }
    return cmds;
}

std::unique_ptr<CostModel> TrimStage::costModel(const ResourceBudget& budget) const {
    (void)budget;
    CostParameters p;
    p.bands = {{32, 6}, {16, 4}, {8, 4}};
    p.defaultThreads = 2;
    p.fixedOverheadMiB = 0;
    p.baseWorkingMiB = 512;
    p.perThreadMiB = 256;
    p.ceilingMinMiB = 1024;
    p.ceilingMaxMiB = 16384;
    p.maxThreads = 16;
    p.expansionCap = 16;
    p.minimalThreads = 2;
    return std::make_unique<BandedCostModel>(std::move(p));
}

std::string TrimStage::degradedNotice(const Job& job) const {
    return "Sample " + job.id + " was trimmed without base correction (--correction disabled)\n"
           "after failing with full settings.\n";
}

}
