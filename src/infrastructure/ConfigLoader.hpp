/**
 * @file ConfigLoader.hpp
 * @brief Loads threshold overrides from settings.json.
 *
 * Keeps threshold tuning in one file instead of scattering literals through the detectors.
 */

#pragma once

#include "domain/analysis/AnalysisProfile.hpp"

#include <string>

namespace structaudit::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads `{"profiles": {"MODE": {"field": value, ...}}}` on top of the built-in defaults.
     * @param path Path to settings.json. A missing or unreadable file yields the defaults.
     * @return The catalog. Unknown modes and keys are logged and ignored.
     */
    static domain::analysis::ProfileCatalog LoadProfiles(const std::string& path);

    /** @brief Same as LoadProfiles, from an in-memory JSON document. */
    static domain::analysis::ProfileCatalog ParseProfiles(const std::string& json);
};

} // namespace structaudit::infrastructure
