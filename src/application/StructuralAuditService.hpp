/**
 * @file StructuralAuditService.hpp
 * @brief Entry point of the engine: analyze a document, apply approved fixes, or both.
 */

#pragma once

#include "application/FixApplicator.hpp"
#include "application/FixPlanner.hpp"
#include "domain/analysis/AnalysisProfile.hpp"
#include "domain/analysis/FixIssue.hpp"
#include "domain/analysis/Issues.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace structaudit::application {

/**
 * @class MalformedInputError
 * @brief Input that cannot be analyzed at all: invalid UTF-8 or above the size ceiling.
 */
class MalformedInputError : public std::invalid_argument {
public:
    explicit MalformedInputError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @struct StructuralReport
 * @brief Everything `analyze` found, per category and as one ordered issue list.
 */
struct StructuralReport {
    domain::analysis::AnalysisMode mode = domain::analysis::AnalysisMode::Apostila;
    std::string requestedMode;
    bool modeRecognized = true;
    bool referenceProvided = false;
    AnalysisFindings findings;
    std::vector<domain::analysis::FixIssue> issues;

    size_t totalIssues() const { return issues.size(); }
};

/// One input of a batch: its name in reports and its full text.
struct SourceText {
    std::string name;
    std::string text;
};

/**
 * @class StructuralAuditService
 * @brief Stateless facade over the detectors, the planner and the applicator.
 *
 * Holds only the read-only profile catalog, so one instance may serve concurrent calls on
 * distinct documents.
 */
class StructuralAuditService {
public:
    explicit StructuralAuditService(domain::analysis::ProfileCatalog catalog = domain::analysis::ProfileCatalog::Defaults(),
                                    bool quiet = false);

    /**
     * @brief Runs every detector over the document.
     * @param reference Secondary text for external content validation. Only its presence is recorded.
     * @throws MalformedInputError for invalid UTF-8 or a document above maxDocumentBytes.
     */
    StructuralReport analyze(const std::string& text, const std::string& mode,
                             const std::optional<std::string>& reference = std::nullopt) const;

    /** @brief Applies the approved subset of a previous report. Never throws for stale fixes. */
    ApplyResult apply(const std::string& text, const std::vector<domain::analysis::FixIssue>& approved,
                      const std::string& mode = "APOSTILA") const;

    /**
     * @brief Paragraphs repeated across the documents of a batch.
     * @throws MalformedInputError naming the first document that fails validation.
     */
    std::vector<domain::analysis::CrossDocumentDuplicate> findCrossDocumentDuplicates(
        const std::vector<SourceText>& sources, const std::string& mode) const;

    /** @brief analyze followed by apply of every autoApplicable issue. */
    ApplyResult autoFix(const std::string& text, const std::string& mode) const;

    const domain::analysis::AnalysisProfile& profileFor(const std::string& mode, bool* recognized = nullptr) const;

    void setQuiet(bool quiet) { m_quiet = quiet; }

private:
    void validate(const std::string& text, const domain::analysis::AnalysisProfile& profile) const;

    domain::analysis::ProfileCatalog m_catalog;
    bool m_quiet;
};

} // namespace structaudit::application
