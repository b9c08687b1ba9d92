/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/manifest.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

namespace cascade {

namespace {
std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::vector<std::string> Manifest::splitItems(const std::string& field) {
    std::vector<std::string> items;
    std::istringstream in(field);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty() && std::find(items.begin(), items.end(), item) == items.end()) {
            items.push_back(item);
        }
    }
    return items;
}

void Manifest::applySelector(StudyRequest& request, const std::string& selector) {
    request.items = splitItems(selector);
    request.allItems = request.items.empty() ||
        std::any_of(request.items.begin(), request.items.end(),
                    [](const std::string& item) { return toLowerCopy(item) == "all"; });
    if (request.allItems) {
        request.items.clear();
    }
}

ManifestResult Manifest::parse(const std::string& text) {
    ManifestResult result;
    std::map<std::string, std::size_t> index;
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        std::vector<std::string> fields;
        std::istringstream row(line);
        std::string field;
        while (std::getline(row, field, '\t')) {
            fields.push_back(trim(field));
        }

        if (fields.empty() || fields[0].empty()) {
            LOG_WARN("Job specification line " + std::to_string(lineNo) + " has no output unit, skipped");
            continue;
        }

        StudyRequest request;
        request.outputUnit = fields[0];
        request.accession = fields.size() > 1 ? fields[1] : "";
        std::string selector = fields.size() > 2 ? fields[2] : "";
        request.auth = fields.size() > 3 ? fields[3] : "";
        applySelector(request, selector);

        auto it = index.find(request.outputUnit);
        if (it == index.end()) {
            index.emplace(request.outputUnit, result.studies.size());
            result.studies.push_back(std::move(request));
            continue;
        }

        StudyRequest& merged = result.studies[it->second];
        LOG_DEBUG("Merging line " + std::to_string(lineNo) + " into " + merged.outputUnit);
        if (merged.accession.empty()) merged.accession = request.accession;
        if (merged.auth.empty()) merged.auth = request.auth;
        if (merged.allItems || request.allItems) {
            merged.allItems = true;
            merged.items.clear();
        } else {
            for (const auto& item : request.items) {
                if (std::find(merged.items.begin(), merged.items.end(), item) == merged.items.end()) {
                    merged.items.push_back(item);
                }
            }
        }
    }

    if (result.studies.empty()) {
        result.error = "no studies found in job specification";
        return result;
    }
    result.ok = true;
    return result;
}

ManifestResult Manifest::parseFile(const std::filesystem::path& path) {
    ManifestResult result;
    std::ifstream file(path);
    if (!file) {
        result.error = "cannot read job specification: " + path.string();
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    result = parse(buffer.str());
    if (!result.ok) {
        result.error += " (" + path.string() + ")";
    }
    return result;
}

std::string Manifest::formatRow(const StudyRequest& request) {
    std::string items;
    if (request.allItems) {
        items = "all";
    } else {
        for (const auto& item : request.items) {
            if (!items.empty()) items += ',';
            items += item;
        }
    }
    std::string row = request.outputUnit + '\t' + request.accession + '\t' + items;
    if (!request.auth.empty()) {
        row += '\t' + request.auth;
    }
    return row;
}

}
