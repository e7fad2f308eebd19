/**
 * @file ReportSerializer.hpp
 * @brief JSON form of analysis reports, fix issues and apply results.
 */

#pragma once

#include "application/FixApplicator.hpp"
#include "application/StructuralAuditService.hpp"
#include "domain/analysis/FixIssue.hpp"
#include "domain/analysis/Issues.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <vector>

namespace structaudit::infrastructure {

/**
 * @class ReportSerializer
 * @brief Converts engine values to and from nlohmann::json.
 *
 * A report written by ToJson can be read back with IssuesFromReport and handed to apply.
 */
class ReportSerializer {
public:
    static nlohmann::json ToJson(const application::StructuralReport& report);

    static nlohmann::json IssueToJson(const domain::analysis::FixIssue& issue);

    /** @throws std::invalid_argument when a required field is missing or has the wrong type. */
    static domain::analysis::FixIssue IssueFromJson(const nlohmann::json& j);

    /** @brief Reads the ordered `issues` array of a report. */
    static std::vector<domain::analysis::FixIssue> IssuesFromReport(const nlohmann::json& report);

    static nlohmann::json ApplyResultToJson(const application::ApplyResult& result);

    /** @brief Batch report with a `cross_file_duplicates` array. */
    static nlohmann::json CrossDocumentDuplicatesToJson(const std::vector<domain::analysis::CrossDocumentDuplicate>& duplicates,
                                                        size_t documentsAnalyzed);
};

} // namespace structaudit::infrastructure
