/*
 * cascade - Batch runner (cascade)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/config.hpp"
#include "cascade/logger.hpp"
#include "cascade/manifest.hpp"
#include "cascade/orchestrator.hpp"
#include "cascade/stages.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace cascade;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "cascade - tiered batch scheduler\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << progName << " <stage> [options] <study> [samples]\n";
    std::cout << "  " << progName << " <stage> [options] --input-file <file.tsv>\n\n";
    std::cout << "Stages:\n";
    std::cout << "  fetch      extract prefetched SRA runs to FASTQ (fasterq-dump, pigz)\n";
    std::cout << "  trim       trim reads (fastp)\n";
    std::cout << "  quant      quantify transcripts (salmon)\n";
    std::cout << "  command    run a command template per job directory\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  study      study directory, relative to the base path\n";
    std::cout << "  samples    comma-separated sample list, or 'all' (default)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --input-file FILE      job specification: study<TAB>accession<TAB>samples<TAB>[auth]\n";
    std::cout << "  -p, --parallel N       run N studies side by side, each with 1/N of the host\n";
    std::cout << "  -f, --force            re-run jobs whose outputs already exist\n";
    std::cout << "  -t, --threads N        tier-1 threads per job (default: from available CPUs)\n";
    std::cout << "  --base-path DIR        base directory for studies (default: /data)\n";
    std::cout << "  --heartbeat SEC        progress message interval (minimum 10)\n";
    std::cout << "  --log-file FILE        also append log lines to FILE\n";
    std::cout << "  --log-level LEVEL      ERROR, WARN, INFO, DEBUG or TRACE\n\n";
    std::cout << "quant options:\n";
    std::cout << "  --index DIR            salmon index (required)\n";
    std::cout << "  --libtype-pe TYPE      library type for paired-end reads (default: A)\n";
    std::cout << "  --libtype-se TYPE      library type for single-end reads (default: A)\n";
    std::cout << "  --extra-args \"ARGS\"    replace the default salmon/fastp arguments\n\n";
    std::cout << "trim options:\n";
    std::cout << "  --length-required N    discard reads shorter than N (default: 36)\n\n";
    std::cout << "fetch options:\n";
    std::cout << "  --ngc FILE             dbGaP key for studies without an auth column\n\n";
    std::cout << "command options:\n";
    std::cout << "  --command \"TEMPLATE\"           e.g. \"mytool -t {threads} -o {output} {inputs}\"\n";
    std::cout << "  --reduced-command \"TEMPLATE\"   template used at tier 3\n";
    std::cout << "  --stage-name NAME              prefix of progress files (default: command)\n";
    std::cout << "  --input-dir NAME               job directories under the study (default: input)\n";
    std::cout << "  --output-dir NAME              outputs under the study (default: output)\n";
    std::cout << "  --output-file NAME             file that marks a finished job (default: result.txt)\n";
    std::cout << "  --job-memory MIB               memory one job needs (default: 1024)\n";
    std::cout << "  --job-threads N                threads one job uses (default: 1)\n";
    std::cout << "  Placeholders: {job} {threads} {memory_mib} {output} {scratch} {fidelity}\n";
    std::cout << "                {input_dir} {inputs} {auth}\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  CASCADE_BASE_PATH           base directory (default: /data)\n";
    std::cout << "  CASCADE_PARALLEL            default for --parallel\n";
    std::cout << "  CASCADE_HEARTBEAT_SEC       default for --heartbeat (60)\n";
    std::cout << "  CASCADE_MEMORY_RESERVE_PCT  share of available memory kept free (10)\n";
    std::cout << "  CASCADE_LOG_LEVEL           log level (INFO)\n\n";
    std::cout << "Exit status: 0 all succeeded, 1 usage, 2 infrastructure error,\n";
    std::cout << "             3 some jobs failed, 130 cancelled\n";
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return kExitSuccess;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return kExitSuccess;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    Logger::initFromEnv();
    Settings settings = loadSettings();

    std::string stageName = argv[1];
    StageOptions stageOptions;
    BatchOptions batch;
    batch.basePath = settings.basePath;
    batch.parallelBatches = settings.parallelBatches;
    batch.heartbeatSeconds = settings.heartbeatSeconds;
    batch.memoryReservePercent = settings.memoryReservePercent;

    std::string inputFile;
    std::string logFile;
    std::string extraArgs;
    bool extraArgsGiven = false;
    std::vector<std::string> positional;

    auto needValue = [&](int& i, const std::string& flag, std::string& out) {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << flag << " needs a value\n";
            return false;
        }
        out = argv[++i];
        return true;
    };
    auto needNumber = [&](int& i, const std::string& flag, int& out) {
        std::string value;
        if (!needValue(i, flag, value)) return false;
        if (!parsePositive(value, out)) {
            std::cerr << "Error: Invalid value for " << flag << ": " << value << "\n";
            return false;
        }
        return true;
    };

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        int number = 0;
        if (arg == "--input-file") {
            if (!needValue(i, arg, inputFile)) return kExitUsage;
        } else if (arg == "-p" || arg == "--parallel") {
            if (!needNumber(i, arg, batch.parallelBatches)) return kExitUsage;
        } else if (arg == "-f" || arg == "--force") {
            batch.force = true;
        } else if (arg == "-t" || arg == "--threads") {
            if (!needNumber(i, arg, number)) return kExitUsage;
            batch.threadsOverride = number;
        } else if (arg == "--base-path") {
            if (!needValue(i, arg, value)) return kExitUsage;
            batch.basePath = value;
        } else if (arg == "--heartbeat") {
            if (!needNumber(i, arg, number)) return kExitUsage;
            batch.heartbeatSeconds = std::max(kMinHeartbeatSeconds, number);
        } else if (arg == "--log-file") {
            if (!needValue(i, arg, logFile)) return kExitUsage;
        } else if (arg == "--log-level") {
            LogLevel level = LogLevel::INFO;
            if (!needValue(i, arg, value)) return kExitUsage;
            if (!Logger::parseLevel(value, level)) {
                std::cerr << "Error: Unknown log level: " << value << "\n";
                return kExitUsage;
            }
            Logger::setLevel(level);
        } else if (arg == "--index") {
            if (!needValue(i, arg, value)) return kExitUsage;
            stageOptions.quant.index = value;
        } else if (arg == "--libtype-pe") {
            if (!needValue(i, arg, stageOptions.quant.libtypePaired)) return kExitUsage;
        } else if (arg == "--libtype-se") {
            if (!needValue(i, arg, stageOptions.quant.libtypeSingle)) return kExitUsage;
        } else if (arg == "--extra-args") {
            if (!needValue(i, arg, extraArgs)) return kExitUsage;
            extraArgsGiven = true;
        } else if (arg == "--length-required") {
            if (!needNumber(i, arg, stageOptions.trim.lengthRequired)) return kExitUsage;
        } else if (arg == "--ngc") {
            if (!needValue(i, arg, value)) return kExitUsage;
            stageOptions.fetch.ngc = value;
        } else if (arg == "--command") {
            if (!needValue(i, arg, stageOptions.command.commandTemplate)) return kExitUsage;
        } else if (arg == "--reduced-command") {
            if (!needValue(i, arg, stageOptions.command.reducedTemplate)) return kExitUsage;
        } else if (arg == "--stage-name") {
            if (!needValue(i, arg, stageOptions.command.stageName)) return kExitUsage;
        } else if (arg == "--input-dir") {
            if (!needValue(i, arg, stageOptions.command.inputDir)) return kExitUsage;
        } else if (arg == "--output-dir") {
            if (!needValue(i, arg, stageOptions.command.outputDir)) return kExitUsage;
        } else if (arg == "--output-file") {
            if (!needValue(i, arg, stageOptions.command.outputFile)) return kExitUsage;
        } else if (arg == "--job-memory") {
            if (!needNumber(i, arg, number)) return kExitUsage;
            stageOptions.command.jobMemoryMiB = number;
        } else if (arg == "--job-threads") {
            if (!needNumber(i, arg, stageOptions.command.threadsPerJob)) return kExitUsage;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return kExitUsage;
        } else {
            positional.push_back(arg);
        }
    }

    if (extraArgsGiven) {
        stageOptions.quant.extraArgs = splitWhitespace(extraArgs);
        stageOptions.trim.extraArgs = splitWhitespace(extraArgs);
    }

    if (!logFile.empty() && !Logger::setLogFile(logFile)) {
        std::cerr << "Error: Cannot open log file: " << logFile << "\n";
        return kExitUsage;
    }

    std::vector<StudyRequest> requests;
    if (!inputFile.empty()) {
        if (!positional.empty()) {
            std::cerr << "Error: Give either --input-file or a study, not both\n";
            return kExitUsage;
        }
        ManifestResult manifest = Manifest::parseFile(inputFile);
        if (!manifest) {
            std::cerr << "Error: " << manifest.error << "\n";
            return kExitInfrastructure;
        }
        requests = std::move(manifest.studies);
    } else {
        if (positional.empty() || positional.size() > 2) {
            printUsage(argv[0]);
            return kExitUsage;
        }
        StudyRequest request;
        request.outputUnit = positional[0];
        Manifest::applySelector(request, positional.size() > 1 ? positional[1] : "all");
        requests.push_back(std::move(request));
    }

    std::string error;
    auto stage = makeStage(stageName, stageOptions, error);
    if (!stage) {
        std::cerr << "Error: " << error << "\n";
        return kExitUsage;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CancellationToken cancel;
    std::atomic<bool> finished{false};
    std::thread watcher([&cancel, &finished] {
        while (!finished.load()) {
            if (g_shutdown_requested && !cancel.cancelled()) {
                LOG_WARN("Shutdown requested, stopping running jobs...");
                cancel.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exitCode = kExitSuccess;
    try {
        Orchestrator orchestrator(*stage, batch, cancel);
        BatchResult result = orchestrator.runBatch(requests);
        exitCode = result.exitCode;

        if (!result.error.empty()) {
            std::cerr << "Error: " << result.error << "\n";
        }
        if (result.reports.size() == 1) {
            std::cout << renderSummary(result.reports.front());
        } else if (!result.reports.empty()) {
            std::cout << renderBatchOverview(result.reports);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exitCode = kExitInfrastructure;
    }

    finished.store(true);
    watcher.join();
    return exitCode;
}
