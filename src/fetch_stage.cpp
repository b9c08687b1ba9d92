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
const char* const kRawDir = "Raw_data";

// Compresses whatever layout fasterq-dump produced for one run.
const char* const kCompressScript =
    "set -e; for f in \"$1/$2.fastq\" \"$1/$2_1.fastq\" \"$1/$2_2.fastq\"; do "
    "if [ -e \"$f\" ]; then pigz -f -1 -p \"$3\" \"$f\"; fi; done";

std::string runName(const std::filesystem::path& sra) {
    return sra.stem().string();
}

bool isSraFile(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    return ext == ".sra" || ext == ".sralite";
}
}

FetchStage::FetchStage(FetchOptions options) : options_(std::move(options)) {
}

int FetchStage::bufferSizeMB(std::int64_t ceilingMiB) noexcept {
    auto gb = ceilingMiB / 1024;
    return static_cast<int>(std::clamp<std::int64_t>(gb * 100, 256, 4096));
}

int FetchStage::cacheSizeMB(std::int64_t ceilingMiB) noexcept {
    auto gb = ceilingMiB / 1024;
    return static_cast<int>(std::clamp<std::int64_t>(gb * 50, 128, 2048));
}

bool FetchStage::validate(const std::filesystem::path& study, std::string& error) const {
    if (!Stage::validate(study, error)) {
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(study / kRawDir, ec)) {
        error = "Raw_data directory not found in " + study.string() + " (prefetch runs first)";
        return false;
    }
    return true;
}

bool FetchStage::checkResources(std::string& error) const {
    return options_.ngc.empty() || checkAuth(options_.ngc.string(), error);
}

bool FetchStage::checkAuth(const std::string& auth, std::string& error) const {
    std::error_code ec;
    if (!auth.empty() && !std::filesystem::exists(auth, ec)) {
        error = "NGC key file not found: " + auth;
        return false;
    }
    return true;
}

std::vector<Job> FetchStage::discover(const std::filesystem::path& study) const {
    std::vector<Job> jobs;
    for (const auto& sampleDir : listDirectories(study / kRawDir)) {
        Job job;
        job.id = sampleDir.filename().string();
        job.sourceDir = sampleDir;
        job.outputDir = sampleDir;

        for (const auto& runDir : listDirectories(sampleDir)) {
            for (const auto& file : listFiles(runDir)) {
                if (isSraFile(file)) {
                    job.inputs.push_back(file);
                    break;
                }
            }
        }

        if (job.inputs.empty()) {
            LOG_DEBUG("No prefetched runs for " + job.id);
            continue;
        }
        jobs.push_back(std::move(job));
    }
    return jobs;
}

std::vector<std::filesystem::path> FetchStage::expectedOutputs(const Job& job) const {
    std::vector<std::filesystem::path> outputs;
    for (const auto& sra : job.inputs) {
        std::string run = runName(sra);
        auto single = job.outputDir / (run + ".fastq.gz");
        auto r1 = job.outputDir / (run + "_1.fastq.gz");
        auto r2 = job.outputDir / (run + "_2.fastq.gz");
        if (isNonEmptyFile(r1) || isNonEmptyFile(r2)) {
            outputs.push_back(r1);
            outputs.push_back(r2);
        } else {
            outputs.push_back(single);
        }
    }
    return outputs;
}

bool FetchStage::isComplete(const Job& job) const {
    if (job.inputs.empty()) {
        return false;
    }
    return std::all_of(job.inputs.begin(), job.inputs.end(), [&](const std::filesystem::path& sra) {
        std::string run = runName(sra);
        if (isNonEmptyFile(job.outputDir / (run + ".fastq.gz"))) {
            return true;
        }
        return isNonEmptyFile(job.outputDir / (run + "_1.fastq.gz")) &&
               isNonEmptyFile(job.outputDir / (run + "_2.fastq.gz"));
    });
}

// The output directory also holds the prefetched runs; only FASTQ files go.
bool FetchStage::cleanPartialOutput(const Job& job) const {
    bool ok = true;
    for (const auto& sra : job.inputs) {
        std::string run = runName(sra);
        for (const auto& file : listFiles(job.outputDir)) {
            std::string name = file.filename().string();
            if (!startsWith(name, run)) {
                continue;
            }
            if (endsWith(name, ".fastq") || endsWith(name, ".fastq.gz")) {
                std::error_code ec;
                std::filesystem::remove(file, ec);
                if (ec) {
                    LOG_ERROR("Failed to remove " + file.string() + ": " + ec.message());
                    ok = false;
                }
            }
        }
    }
    return ok;
}

std::vector<Command> FetchStage::commands(const Job& job, const JobResourceProfile& profile,
                                          const std::filesystem::path& scratch) const {
    std::vector<Command> cmds;
    bool reduced = profile.fidelity == FidelityMode::Reduced;
    int bufsize = reduced ? 256 : bufferSizeMB(profile.memoryCeilingMiB);
    int cache = reduced ? 128 : cacheSizeMB(profile.memoryCeilingMiB);
    std::string ngc = job.auth.empty() ? options_.ngc.string() : job.auth;
    std::int64_t memMB = reduced ? std::min<std::int64_t>(profile.memoryCeilingMiB, 2048)
                                 : profile.memoryCeilingMiB;

    for (const auto& sra : job.inputs) {
        Command dump;
        dump.argv = {"fasterq-dump", sra.string(), "--split-3", "--force",
                     "--threads", std::to_string(profile.threads),
                     "--temp", scratch.string(),
                     "--mem", std::to_string(memMB) + "MB",
                     "--bufsize", std::to_string(bufsize) + "MB",
                     "--curcache", std::to_string(cache) + "MB",
                     "--outdir", job.outputDir.string()};
        if (!ngc.empty()) {
            dump.argv.push_back("--ngc");
            dump.argv.push_back(ngc);
        }
        cmds.push_back(std::move(dump));

        Command compress;
        compress.argv = {"sh", "-c", kCompressScript, "cascade-compress",
                         job.outputDir.string(), runName(sra), std::to_string(profile.threads)};
        cmds.push_back(std::move(compress));
    }
    return cmds;
}

std::unique_ptr<CostModel> FetchStage::costModel(const ResourceBudget& budget) const {
    (void)budget;
    CostParameters p;
    p.bands = {};
    p.defaultThreads = 2;
    p.fixedOverheadMiB = 0;
    p.baseWorkingMiB = 2048;
    p.perThreadMiB = 256;
    p.ceilingMinMiB = 2048;
    p.ceilingMaxMiB = 65536;
    p.maxThreads = 4;
    p.expansionCap = 4;
    p.minimalThreads = 2;
    return std::make_unique<BandedCostModel>(std::move(p));
}

std::string FetchStage::degradedNotice(const Job& job) const {
    return "Sample " + job.id + " was extracted with minimal threads and buffers\n"
           "after failing with full settings. Verify read counts before use.\n";
}

}
