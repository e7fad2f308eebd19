/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>

namespace structaudit::infrastructure {

using domain::analysis::AnalysisMode;
using domain::analysis::AnalysisProfile;
using domain::analysis::ProfileCatalog;

namespace {

using Setter = std::function<void(AnalysisProfile&, const nlohmann::json&)>;

const std::map<std::string, Setter>& Setters() {
    static const std::map<std::string, Setter> setters = {
        {"minParagraphChars", [](AnalysisProfile& p, const nlohmann::json& v) { p.minParagraphChars = v.get<size_t>(); }},
        {"minTokenLength", [](AnalysisProfile& p, const nlohmann::json& v) { p.minTokenLength = v.get<size_t>(); }},
        {"nearSimilarityThreshold", [](AnalysisProfile& p, const nlohmann::json& v) { p.nearSimilarityThreshold = v.get<double>(); }},
        {"nearJaccardThreshold", [](AnalysisProfile& p, const nlohmann::json& v) { p.nearJaccardThreshold = v.get<double>(); }},
        {"maxScanCandidates", [](AnalysisProfile& p, const nlohmann::json& v) { p.maxScanCandidates = v.get<size_t>(); }},
        {"sectionLeadChars", [](AnalysisProfile& p, const nlohmann::json& v) { p.sectionLeadChars = v.get<size_t>(); }},
        {"titleMismatchThreshold", [](AnalysisProfile& p, const nlohmann::json& v) { p.titleMismatchThreshold = v.get<double>(); }},
        {"titleMismatchMinBodyChars", [](AnalysisProfile& p, const nlohmann::json& v) { p.titleMismatchMinBodyChars = v.get<size_t>(); }},
        {"titleSimilarityThreshold", [](AnalysisProfile& p, const nlohmann::json& v) { p.titleSimilarityThreshold = v.get<double>(); }},
        {"parentBodyOverlapMax", [](AnalysisProfile& p, const nlohmann::json& v) { p.parentBodyOverlapMax = v.get<double>(); }},
        {"siblingBodySimilarityMax", [](AnalysisProfile& p, const nlohmann::json& v) { p.siblingBodySimilarityMax = v.get<double>(); }},
        {"tableParentMargin", [](AnalysisProfile& p, const nlohmann::json& v) { p.tableParentMargin = v.get<double>(); }},
        {"tableParentMinSimilarity", [](AnalysisProfile& p, const nlohmann::json& v) { p.tableParentMinSimilarity = v.get<double>(); }},
        {"autoApplyConfidenceFloor", [](AnalysisProfile& p, const nlohmann::json& v) { p.autoApplyConfidenceFloor = v.get<double>(); }},
        {"maxDocumentBytes", [](AnalysisProfile& p, const nlohmann::json& v) { p.maxDocumentBytes = v.get<size_t>(); }},
    };
    return setters;
}

} // namespace

ProfileCatalog ConfigLoader::ParseProfiles(const std::string& json) {
    std::map<AnalysisMode, AnalysisProfile> profiles;
    for (auto mode : {AnalysisMode::Apostila, AnalysisMode::Fidelidade, AnalysisMode::Audiencia,
                      AnalysisMode::Reuniao, AnalysisMode::Depoimento}) {
        profiles[mode] = AnalysisProfile::ForMode(mode);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[ConfigLoader] Error parsing settings: " << e.what() << std::endl;
        return ProfileCatalog(std::move(profiles));
    }

    if (!j.is_object() || !j.contains("profiles") || !j["profiles"].is_object()) {
        return ProfileCatalog(std::move(profiles));
    }

    for (const auto& [modeName, overrides] : j["profiles"].items()) {
        bool recognized = false;
        const AnalysisMode mode = domain::analysis::ParseMode(modeName, &recognized);
        if (!recognized) {
            std::cerr << "[ConfigLoader] Ignoring unknown mode '" << modeName << "'" << std::endl;
            continue;
        }
        if (!overrides.is_object()) continue;

        AnalysisProfile& profile = profiles[mode];
        for (const auto& [key, value] : overrides.items()) {
            auto setter = Setters().find(key);
            if (setter == Setters().end()) {
                std::cerr << "[ConfigLoader] Ignoring unknown key '" << key << "' for " << modeName << std::endl;
                continue;
            }
            if (!value.is_number() || value.get<double>() < 0.0) {
                std::cerr << "[ConfigLoader] Expected a non-negative number for '" << key << "' in " << modeName << std::endl;
                continue;
            }
            try {
                setter->second(profile, value);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[ConfigLoader] Invalid value for '" << key << "': " << e.what() << std::endl;
            }
        }
    }
    return ProfileCatalog(std::move(profiles));
}

ProfileCatalog ConfigLoader::LoadProfiles(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return ProfileCatalog::Defaults();
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Could not open " << path << std::endl;
        return ProfileCatalog::Defaults();
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return ParseProfiles(buffer.str());
}

} // namespace structaudit::infrastructure
