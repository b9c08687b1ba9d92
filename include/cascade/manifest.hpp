/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace cascade {

// One output unit (study directory) and the items (samples) to process in it.
struct StudyRequest {
    std::string outputUnit;
    std::string accession;
    std::vector<std::string> items;
    bool allItems = true;
    std::string auth;
};

struct ManifestResult {
    bool ok = false;
    std::vector<StudyRequest> studies;
    std::string error;

    explicit operator bool() const noexcept { return ok; }
};

// Tab-separated job specification:
//   outputUnit <TAB> accession <TAB> items <TAB> [auth]
// Rows sharing an output unit are merged; "all" beats any explicit list.
class Manifest final {
public:
    [[nodiscard]] static ManifestResult parseFile(const std::filesystem::path& path);
    [[nodiscard]] static ManifestResult parse(const std::string& text);

    [[nodiscard]] static std::string formatRow(const StudyRequest& request);
    [[nodiscard]] static std::vector<std::string> splitItems(const std::string& field);

    // Comma list, or "all"/empty for every item.
    static void applySelector(StudyRequest& request, const std::string& selector);
};

}
