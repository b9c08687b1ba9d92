#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cascade {

// Job lifecycle. Failed tiers 1 and 2 send a job back to Pending for the next tier.
enum class JobState : std::uint8_t { Pending, Running, Succeeded, Failed };

enum class Tier : std::uint8_t { One = 1, Two = 2, Three = 3 };

enum class Outcome : std::uint8_t { Success, Failure, Cancelled };

// Reduced fidelity drops optional accuracy features to shrink the footprint.
enum class FidelityMode : std::uint8_t { Full, Reduced };

// Sample/unit identifier, unique within a batch.
using JobId = std::string;

struct Job {
    JobId id;
    std::vector<std::filesystem::path> inputs;
    std::filesystem::path sourceDir;
    std::filesystem::path outputDir;
    std::string auth;  // access credential of the study, may be empty
    JobState state = JobState::Pending;
};

// Per-attempt resource assignment handed to a job body.
struct JobResourceProfile {
    Tier tier = Tier::One;
    int threads = 1;
    std::int64_t memoryRequiredMiB = 0;
    std::int64_t memoryCeilingMiB = 0;
    FidelityMode fidelity = FidelityMode::Full;
};

inline int tierNumber(Tier tier) noexcept { return static_cast<int>(tier); }

inline const char* outcomeToString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Success: return "success";
        case Outcome::Failure: return "failure";
        case Outcome::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

inline const char* fidelityToString(FidelityMode mode) noexcept {
    return mode == FidelityMode::Full ? "full" : "reduced";
}

} // namespace cascade
