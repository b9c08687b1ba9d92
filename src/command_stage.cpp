/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/stages.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace cascade {

namespace {
void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

CommandStage::CommandStage(CommandOptions options) : options_(std::move(options)) {
    options_.threadsPerJob = std::max(1, options_.threadsPerJob);
    options_.jobMemoryMiB = std::max<std::int64_t>(1, options_.jobMemoryMiB);
}

std::vector<std::string> CommandStage::requiredExecutables() const {
    std::vector<std::string> exes;
    for (const auto* templ : {&options_.commandTemplate, &options_.reducedTemplate}) {
        auto tokens = splitWhitespace(*templ);
        if (!tokens.empty() && tokens.front().find('{') == std::string::npos &&
            std::find(exes.begin(), exes.end(), tokens.front()) == exes.end()) {
            exes.push_back(tokens.front());
        }
    }
    return exes;
}

bool CommandStage::checkResources(std::string& error) const {
    if (splitWhitespace(options_.commandTemplate).empty()) {
        error = "no command template given (--command)";
        return false;
    }
    return true;
}

bool CommandStage::validate(const std::filesystem::path& study, std::string& error) const {
    if (!Stage::validate(study, error)) {
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(study / options_.inputDir, ec)) {
        error = "input directory not found: " + (study / options_.inputDir).string();
        return false;
    }
    return true;
}

std::vector<Job> CommandStage::discover(const std::filesystem::path& study) const {
    std::vector<Job> jobs;
    for (const auto& dir : listDirectories(study / options_.inputDir)) {
        Job job;
        job.id = dir.filename().string();
        job.sourceDir = dir;
        job.outputDir = study / options_.outputDir / job.id;
        job.inputs = listFiles(dir);
        jobs.push_back(std::move(job));
    }
    return jobs;
}

std::vector<std::filesystem::path> CommandStage::expectedOutputs(const Job& job) const {
    return {job.outputDir / options_.outputFile};
}

std::vector<std::string> CommandStage::expand(const std::string& templ, const Job& job,
                                              const JobResourceProfile& profile,
                                              const std::filesystem::path& scratch) const {
    std::vector<std::string> argv;
    for (auto token : splitWhitespace(templ)) {
        if (token == "{inputs}") {
            for (const auto& input : job.inputs) {
                argv.push_back(input.string());
            }
            continue;
        }
        replaceAll(token, "{job}", job.id);
        replaceAll(token, "{threads}", std::to_string(profile.threads));
        replaceAll(token, "{memory_mib}", std::to_string(profile.memoryCeilingMiB));
        replaceAll(token, "{output}", job.outputDir.string());
        replaceAll(token, "{scratch}", scratch.string());
        replaceAll(token, "{fidelity}", fidelityToString(profile.fidelity));
        replaceAll(token, "{input_dir}", job.sourceDir.string());
        replaceAll(token, "{auth}", job.auth);
        argv.push_back(std::move(token));
    }
    return argv;
}

std::vector<Command> CommandStage::commands(const Job& job, const JobResourceProfile& profile,
                                            const std::filesystem::path& scratch) const {
    const std::string& templ =
        (profile.fidelity == FidelityMode::Reduced && !options_.reducedTemplate.empty())
            ? options_.reducedTemplate
            : options_.commandTemplate;

    Command cmd;
    cmd.argv = expand(templ, job, profile, scratch);
    return {cmd};
}

std::unique_ptr<CostModel> CommandStage::costModel(const ResourceBudget& budget) const {
    (void)budget;
    CostParameters p;
    p.bands = {};
    p.defaultThreads = options_.threadsPerJob;
    p.fixedOverheadMiB = 0;
    p.baseWorkingMiB = options_.jobMemoryMiB;
    p.perThreadMiB = 0;
    p.ceilingMinMiB = options_.jobMemoryMiB;
    p.ceilingMaxMiB = std::numeric_limits<std::int64_t>::max() / 4;
    p.maxThreads = std::max(16, options_.threadsPerJob);
    p.expansionCap = 12;
    p.minimalThreads = 1;
    return std::make_unique<BandedCostModel>(std::move(p));
}

std::unique_ptr<Stage> makeStage(const std::string& name, const StageOptions& options,
                                 std::string& error) {
    if (name == "quant") {
        return std::make_unique<QuantStage>(options.quant);
    }
    if (name == "trim") {
        return std::make_unique<TrimStage>(options.trim);
    }
    if (name == "fetch") {
        return std::make_unique<FetchStage>(options.fetch);
    }
    if (name == "command") {
        return std::make_unique<CommandStage>(options.command);
    }
    error = "unknown stage: " + name + " (expected quant, trim, fetch or command)";
    return nullptr;
}

}
