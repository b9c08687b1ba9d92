/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/stages.hpp"
#include "cascade/logger.hpp"
#include <algorithm>

namespace cascade {

namespace {
const char* const kTrimmedDir = "Trimmed_data";
const char* const kAlignedDir = "Aligned_data";
const char* const kReadPrefix = "fastp_";
const char* const kReadSuffix = ".fastq.gz";
const char* const kR1Suffix = "_1.fastq.gz";
const char* const kR2Suffix = "_2.fastq.gz";

struct ReadLayout {
    std::vector<std::filesystem::path> r1;
    std::vector<std::filesystem::path> r2;
    std::vector<std::filesystem::path> single;

    bool paired() const { return !r1.empty(); }
};

// Technical replicates are merged: every R1 goes to -1 and every R2 to -2.
ReadLayout classifyReads(const std::string& jobId, const std::vector<std::filesystem::path>& files) {
    ReadLayout layout;
    for (const auto& file : files) {
        std::string name = file.filename().string();
        if (!endsWith(name, kR1Suffix)) {
            continue;
        }
        auto mate = file.parent_path() /
                    (name.substr(0, name.size() - std::string(kR1Suffix).size()) + kR2Suffix);
        if (std::find(files.begin(), files.end(), mate) != files.end()) {
            layout.r1.push_back(file);
            layout.r2.push_back(mate);
        } else {
            LOG_WARN(jobId + ": " + name + " has no R2 mate, skipping it");
        }
    }

    if (!layout.paired()) {
        for (const auto& file : files) {
            if (!endsWith(file.filename().string(), kR2Suffix)) {
                layout.single.push_back(file);
            }
        }
    }
    return layout;
}
}

QuantStage::QuantStage(QuantOptions options) : options_(std::move(options)) {
}

bool QuantStage::isBiasFlag(const std::string& arg) noexcept {
    return arg == "--seqBias" || arg == "--gcBias" || arg == "--posBias";
}

bool QuantStage::validate(const std::filesystem::path& study, std::string& error) const {
    if (!Stage::validate(study, error)) {
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(study / kTrimmedDir, ec)) {
        error = "Trimmed_data directory not found in " + study.string() + " (run trim first)";
        return false;
    }
    return true;
}

bool QuantStage::checkResources(std::string& error) const {
    std::error_code ec;
    if (options_.index.empty() || !std::filesystem::exists(options_.index, ec)) {
        error = "salmon index not found: " + options_.index.string();
        return false;
    }
    return true;
}

std::vector<Job> QuantStage::discover(const std::filesystem::path& study) const {
    std::vector<Job> jobs;
    std::vector<std::string> empty;

    for (const auto& dir : listDirectories(study / kTrimmedDir)) {
        std::string sample = dir.filename().string();
        if (sample == "FastQC" || sample == "MultiQC") {
            continue;
        }

        Job job;
        job.id = sample;
        job.sourceDir = dir;
        job.outputDir = study / kAlignedDir / sample;
        for (const auto& file : listFiles(dir)) {
            std::string name = file.filename().string();
            if (startsWith(name, kReadPrefix) && endsWith(name, kReadSuffix)) {
                job.inputs.push_back(file);
            }
        }

        if (job.inputs.empty()) {
            empty.push_back(sample);
            continue;
        }
        jobs.push_back(std::move(job));
    }

    if (!empty.empty()) {
        LOG_WARN(std::to_string(empty.size()) +
                 " sample directories contain no fastp_*.fastq.gz files (failed trimming?)");
        for (const auto& sample : empty) {
            LOG_WARN("  " + sample);
        }
    }
    return jobs;
}

std::vector<std::filesystem::path> QuantStage::expectedOutputs(const Job& job) const {
    return {job.outputDir / "quant.sf"};
}

std::vector<Command> QuantStage::commands(const Job& job, const JobResourceProfile& profile,
                                          const std::filesystem::path& scratch) const {
    (void)scratch;
    ReadLayout layout = classifyReads(job.id, job.inputs);

    Command cmd;
    cmd.argv = {"salmon", "quant", "-i", options_.index.string(), "-l",
                layout.paired() ? options_.libtypePaired : options_.libtypeSingle};

    if (layout.paired()) {
        cmd.argv.push_back("-1");
        for (const auto& f : layout.r1) cmd.argv.push_back(f.string());
        cmd.argv.push_back("-2");
        for (const auto& f : layout.r2) cmd.argv.push_back(f.string());
    } else {
        cmd.argv.push_back("-r");
        for (const auto& f : layout.single) cmd.argv.push_back(f.string());
    }

    for (const auto& arg : options_.extraArgs) {
        if (profile.fidelity == FidelityMode::Reduced && isBiasFlag(arg)) {
            continue;
        }
        cmd.argv.push_back(arg);
    }

    cmd.argv.push_back("--threads");
    cmd.argv.push_back(std::to_string(profile.threads));
    cmd.argv.push_back("-o");
    cmd.argv.push_back(job.outputDir.string());
    return {cmd};
}

std::unique_ptr<CostModel> QuantStage::costModel(const ResourceBudget& budget) const {
    (void)budget;
    CostParameters p;
    p.bands = {{32, 8}, {16, 6}, {8, 4}, {4, 4}};
    p.defaultThreads = 2;
    p.fixedOverheadMiB = estimateFixedOverheadMiB(options_.index);
    p.baseWorkingMiB = 1024;
    p.perThreadMiB = 512;
    p.ceilingMinMiB = 4096;
    p.ceilingMaxMiB = 65536;
    p.maxThreads = 16;
    p.expansionCap = 12;
    p.minimalThreads = 2;
    LOG_INFO("salmon index overhead: " + std::to_string(p.fixedOverheadMiB) + " MiB");
    return std::make_unique<BandedCostModel>(std::move(p));
}

std::string QuantStage::degradedNotice(const Job& job) const {
    return "Sample " + job.id + " was quantified without bias correction\n"
           "(--seqBias --gcBias --posBias disabled) after failing with full settings.\n"
           "Abundance estimates may be less accurate than for other samples.\n";
}

}
