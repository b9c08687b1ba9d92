/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "cascade/stage.hpp"

namespace cascade {

struct QuantOptions {
    std::filesystem::path index;
    std::string libtypePaired = "A";
    std::string libtypeSingle = "A";
    std::vector<std::string> extraArgs{"--validateMappings", "--seqBias", "--gcBias",
                                       "--posBias", "--dumpEq"};
};

struct TrimOptions {
    int lengthRequired = 36;
    std::vector<std::string> extraArgs{"--trim_poly_x", "--correction", "--detect_adapter_for_pe"};
};

struct FetchOptions {
    std::filesystem::path ngc;  // dbGaP access key for studies without their own
};

struct CommandOptions {
    std::string stageName = "command";
    std::string commandTemplate;
    std::string reducedTemplate;  // empty: reduced fidelity reuses commandTemplate
    std::string inputDir = "input";
    std::string outputDir = "output";
    std::string outputFile = "result.txt";
    std::int64_t jobMemoryMiB = 1024;
    int threadsPerJob = 1;
};

// Transcript quantification with salmon.
class QuantStage final : public Stage {
public:
    explicit QuantStage(QuantOptions options);

    [[nodiscard]] std::string name() const override { return "quant"; }
    [[nodiscard]] std::vector<std::string> requiredExecutables() const override { return {"salmon"}; }
    [[nodiscard]] bool checkResources(std::string& error) const override;
    [[nodiscard]] bool validate(const std::filesystem::path& study, std::string& error) const override;
    [[nodiscard]] std::vector<Job> discover(const std::filesystem::path& study) const override;
    [[nodiscard]] std::vector<std::filesystem::path> expectedOutputs(const Job& job) const override;
    [[nodiscard]] std::vector<Command> commands(const Job& job, const JobResourceProfile& profile,
                                                const std::filesystem::path& scratch) const override;
    [[nodiscard]] std::unique_ptr<CostModel> costModel(const ResourceBudget& budget) const override;
    [[nodiscard]] std::string degradedNotice(const Job& job) const override;

    [[nodiscard]] static bool isBiasFlag(const std::string& arg) noexcept;

private:
    QuantOptions options_;
};

// Adapter and quality trimming with fastp, one invocation per run.
class TrimStage final : public Stage {
public:
    explicit TrimStage(TrimOptions options);

    [[nodiscard]] std::string name() const override { return "trim"; }
    [[nodiscard]] std::vector<std::string> requiredExecutables() const override { return {"fastp"}; }
    [[nodiscard]] bool validate(const std::filesystem::path& study, std::string& error) const override;
    [[nodiscard]] std::vector<Job> discover(const std::filesystem::path& study) const override;
    [[nodiscard]] std::vector<std::filesystem::path> expectedOutputs(const Job& job) const override;
    [[nodiscard]] std::vector<Command> commands(const Job& job, const JobResourceProfile& profile,
                                                const std::filesystem::path& scratch) const override;
    [[nodiscard]] std::unique_ptr<CostModel> costModel(const ResourceBudget& budget) const override;
    [[nodiscard]] std::string degradedNotice(const Job& job) const override;

private:
    TrimOptions options_;
};

// FASTQ extraction of prefetched runs with fasterq-dump, compressed by pigz.
class FetchStage final : public Stage {
public:
    explicit FetchStage(FetchOptions options);

    [[nodiscard]] std::string name() const override { return "fetch"; }
    [[nodiscard]] std::vector<std::string> requiredExecutables() const override {
        return {"fasterq-dump", "pigz", "sh"};
    }
    [[nodiscard]] bool checkResources(std::string& error) const override;
    [[nodiscard]] bool checkAuth(const std::string& auth, std::string& error) const override;
    [[nodiscard]] bool validate(const std::filesystem::path& study, std::string& error) const override;
    [[nodiscard]] std::vector<Job> discover(const std::filesystem::path& study) const override;
    [[nodiscard]] std::vector<std::filesystem::path> expectedOutputs(const Job& job) const override;
    [[nodiscard]] bool isComplete(const Job& job) const override;
    [[nodiscard]] bool cleanPartialOutput(const Job& job) const override;
    [[nodiscard]] std::vector<Command> commands(const Job& job, const JobResourceProfile& profile,
                                                const std::filesystem::path& scratch) const override;
    [[nodiscard]] std::unique_ptr<CostModel> costModel(const ResourceBudget& budget) const override;
    [[nodiscard]] std::string degradedNotice(const Job& job) const override;

    // fasterq-dump buffer sizes in MB for a memory ceiling.
    [[nodiscard]] static int bufferSizeMB(std::int64_t ceilingMiB) noexcept;
    [[nodiscard]] static int cacheSizeMB(std::int64_t ceilingMiB) noexcept;

private:
    FetchOptions options_;
};

// Arbitrary tool driven by a command template.
class CommandStage final : public Stage {
public:
    explicit CommandStage(CommandOptions options);

    [[nodiscard]] std::string name() const override { return options_.stageName; }
    [[nodiscard]] std::vector<std::string> requiredExecutables() const override;
    [[nodiscard]] bool checkResources(std::string& error) const override;
    [[nodiscard]] bool validate(const std::filesystem::path& study, std::string& error) const override;
    [[nodiscard]] std::vector<Job> discover(const std::filesystem::path& study) const override;
    [[nodiscard]] std::vector<std::filesystem::path> expectedOutputs(const Job& job) const override;
    [[nodiscard]] std::vector<Command> commands(const Job& job, const JobResourceProfile& profile,
                                                const std::filesystem::path& scratch) const override;
    [[nodiscard]] std::unique_ptr<CostModel> costModel(const ResourceBudget& budget) const override;

    // Whitespace-split template with placeholders substituted.
    [[nodiscard]] std::vector<std::string> expand(const std::string& templ, const Job& job,
                                                  const JobResourceProfile& profile,
                                                  const std::filesystem::path& scratch) const;

private:
    CommandOptions options_;
};

struct StageOptions {
    QuantOptions quant;
    TrimOptions trim;
    FetchOptions fetch;
    CommandOptions command;
};

[[nodiscard]] std::unique_ptr<Stage> makeStage(const std::string& name, const StageOptions& options,
                                               std::string& error);

[[nodiscard]] std::vector<std::string> splitWhitespace(const std::string& text);

}
