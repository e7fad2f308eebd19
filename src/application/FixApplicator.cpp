/**
 * @file FixApplicator.cpp
 * @brief Implementation of FixApplicator.
 */

#include "application/FixApplicator.hpp"
#include "domain/analysis/DuplicateDetector.hpp"
#include "domain/analysis/HeadingNumbering.hpp"
#include "domain/analysis/TablePlacementAnalyzer.hpp"
#include "domain/document/Document.hpp"
#include "domain/text/Fingerprint.hpp"
#include "domain/text/TextUtils.hpp"

#include <algorithm>
#include <cstddef>

namespace structaudit::application {

using namespace domain::analysis;
using domain::document::Document;
using domain::document::DocumentParser;
namespace text = domain::text;

namespace {

int Phase(FixAction action) {
    switch (action) {
        case FixAction::Remove:
        case FixAction::Merge: return 0;
        case FixAction::Move: return 1;
        case FixAction::Rename: return 2;
        case FixAction::Renumber: return 3;
        default: return 2;
    }
}

// Erases [begin, end) and collapses the blank line pair the cut may leave behind.
void EraseLines(std::vector<std::string>& lines, size_t begin, size_t end) {
    end = std::min(end, lines.size());
    if (begin >= end) return;
    lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(begin), lines.begin() + static_cast<std::ptrdiff_t>(end));
    if (begin >= lines.size() || !text::IsBlank(lines[begin])) return;
    if (begin > 0 && text::IsBlank(lines[begin - 1])) {
        lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(begin - 1));
    } else if (begin == 0 && lines.size() > 1) {
        lines.erase(lines.begin());
    }
}

// Inserts `block` at `at`, keeping one blank line on each side. Added blank lines follow the
// block's line ending.
void InsertBlock(std::vector<std::string>& lines, size_t at, const std::vector<std::string>& block) {
    const std::string blank = block.empty() ? "" : domain::document::LineTerminator(block.front());
    std::vector<std::string> chunk;
    if (at > 0 && !text::IsBlank(lines[at - 1])) chunk.push_back(blank);
    chunk.insert(chunk.end(), block.begin(), block.end());
    if (at < lines.size() && !text::IsBlank(lines[at])) chunk.push_back(blank);
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(at), chunk.begin(), chunk.end());
}

std::string Applied(const FixIssue& issue) {
    return FixActionToString(issue.action) + " " + issue.id + ": " + issue.description;
}

} // namespace

FixApplicator::FixApplicator(const AnalysisProfile& profile) : m_profile(profile) {}

ApplyResult FixApplicator::apply(const std::string& source, const std::vector<FixIssue>& approved) const {
    ApplyResult result;
    result.originalSize = source.size();

    std::vector<const FixIssue*> ordered;
    for (const auto& issue : approved) ordered.push_back(&issue);
    std::stable_sort(ordered.begin(), ordered.end(), [](const FixIssue* a, const FixIssue* b) {
        return Phase(a->action) < Phase(b->action);
    });

    std::string current = source;
    std::vector<const FixIssue*> renumbers;

    for (const FixIssue* issue : ordered) {
        if (issue->action == FixAction::Renumber) {
            renumbers.push_back(issue);
            continue;
        }

        StepResult step;
        if (const auto* remove = std::get_if<RemoveParagraphFix>(&issue->payload)) {
            step = removeParagraph(current, *remove);
        } else if (const auto* merge = std::get_if<MergeSectionFix>(&issue->payload)) {
            step = mergeSection(current, *merge);
        } else if (const auto* move = std::get_if<MoveTableFix>(&issue->payload)) {
            step = moveTable(current, *move);
            result.moveOutcomes.push_back({issue->id, step.text.has_value(), step.text ? "" : step.detail});
        } else if (const auto* rename = std::get_if<RenameHeadingFix>(&issue->payload)) {
            step = renameHeading(current, *rename);
        } else {
            step.detail = "payload does not match action " + FixActionToString(issue->action);
        }

        if (step.text) {
            current = *step.text;
            result.fixesApplied.push_back(Applied(*issue));
        } else {
            result.skipped.push_back({issue->id, step.reason, step.detail});
        }
    }

    if (!renumbers.empty()) {
        const RenumberResult renumbered = HeadingNumbering::Renumber(current);
        for (const FixIssue* issue : renumbers) {
            if (renumbered.changed) {
                result.fixesApplied.push_back(Applied(*issue));
            } else {
                result.skipped.push_back({issue->id, SkipReason::FixNotApplicable, "numbering already consistent"});
            }
        }
        current = renumbered.text;
    }

    result.newText = std::move(current);
    result.newSize = result.newText.size();
    return result;
}

FixApplicator::StepResult FixApplicator::removeParagraph(const std::string& source, const RemoveParagraphFix& fix) const {
    StepResult step;
    Document doc = DocumentParser::Parse(source);

    std::vector<const domain::document::Paragraph*> targets;
    if (fix.kind == MatchKind::Exact) {
        for (const auto& para : doc.paragraphs) {
            if (para.fingerprint == fix.fingerprint) targets.push_back(&para);
        }
        if (targets.size() < 2) {
            step.detail = "no repeated paragraph with fingerprint " + fix.fingerprint;
            return step;
        }
        targets.erase(targets.begin());
    } else {
        bool keptSeen = false;
        for (const auto& para : doc.paragraphs) {
            if (keptSeen && para.fingerprint == fix.fingerprint) {
                targets.push_back(&para);
                break;
            }
            if (para.fingerprint == fix.keepFingerprint) keptSeen = true;
        }
        if (targets.empty()) {
            step.detail = "paragraph " + fix.fingerprint + " not found after its kept occurrence";
            return step;
        }
    }

    for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
        EraseLines(doc.lines, (*it)->startLine, (*it)->endLine);
    }
    step.text = doc.text();
    return step;
}

FixApplicator::StepResult FixApplicator::mergeSection(const std::string& source, const MergeSectionFix& fix) const {
    StepResult step;
    Document doc = DocumentParser::Parse(source);

    int kept = -1;
    int dropped = -1;
    for (const auto& section : doc.sections) {
        if (section.level != fix.level) continue;
        const std::string key = text::FingerprintNormalized(
            DuplicateDetector::SectionKey(doc, section, m_profile.sectionLeadChars));
        if (kept < 0) {
            if (key == fix.keepKey) kept = section.index;
        } else if (key == fix.dropKey) {
            dropped = section.index;
            break;
        }
    }
    if (dropped < 0) {
        step.detail = "duplicate section \"" + fix.title + "\" no longer present";
        return step;
    }

    // Only the duplicate heading and its own body go. Its subsections carry on under the kept
    // section, after the kept section's last line.
    const auto& section = doc.sections[dropped];
    const auto& keeper = doc.sections[kept];
    std::vector<std::string> children(doc.lines.begin() + static_cast<std::ptrdiff_t>(section.bodyEnd),
                                      doc.lines.begin() + static_cast<std::ptrdiff_t>(section.subtreeEnd));
    while (!children.empty() && text::IsBlank(children.back())) children.pop_back();

    EraseLines(doc.lines, section.headingLine, section.subtreeEnd);
    if (!children.empty()) {
        size_t at = std::min(keeper.subtreeEnd, doc.lines.size());
        while (at > keeper.headingLine + 1 && text::IsBlank(doc.lines[at - 1])) --at;
        InsertBlock(doc.lines, at, children);
    }
    step.text = doc.text();
    return step;
}

FixApplicator::StepResult FixApplicator::moveTable(const std::string& source, const MoveTableFix& fix) const {
    StepResult step;
    const Document before = DocumentParser::Parse(source);
    const TableSignature signatureBefore = TablePlacementAnalyzer::Signature(before);

    const auto blocks = TablePlacementAnalyzer::FindTableBlocks(before);
    const TableBlock* block = nullptr;
    size_t occurrence = 0;
    for (const auto& candidate : blocks) {
        if (candidate.normalizedHeading != fix.normalizedHeading || candidate.rowCount != fix.rowCount) continue;
        if (occurrence++ == fix.tableOccurrence) {
            block = &candidate;
            break;
        }
    }
    if (!block) {
        step.detail = "table \"" + fix.headingText + "\" not found";
        return step;
    }

    std::vector<std::string> blockLines(before.lines.begin() + static_cast<std::ptrdiff_t>(block->headingLine),
                                        before.lines.begin() + static_cast<std::ptrdiff_t>(block->endLine));
    std::vector<std::string> lines = before.lines;
    EraseLines(lines, block->headingLine, block->endLine);

    const Document extracted = DocumentParser::Parse(text::JoinLines(lines));
    const domain::document::Section* anchor = nullptr;
    size_t seen = 0;
    for (const auto& section : extracted.sections) {
        if (section.rawHeading != fix.anchorHeading) continue;
        if (seen++ == fix.anchorOccurrence) {
            anchor = &section;
            break;
        }
    }
    if (!anchor) {
        step.detail = "anchor heading \"" + fix.anchorHeading + "\" not found";
        return step;
    }

    size_t at = 0;
    if (fix.strategy == TablePlacementStrategy::H2IntroToSectionEnd) {
        at = anchor->subtreeEnd;
        while (at > anchor->headingLine + 1 && text::IsBlank(lines[at - 1])) --at;
    } else {
        at = anchor->headingLine;
        while (at > 0 && text::IsBlank(lines[at - 1])) --at;
    }
    InsertBlock(lines, at, blockLines);

    std::string moved = text::JoinLines(lines);
    const TableSignature signatureAfter = TablePlacementAnalyzer::Signature(DocumentParser::Parse(moved));
    if (signatureAfter != signatureBefore) {
        step.reason = SkipReason::IntegrityViolation;
        step.detail = "moving \"" + fix.headingText + "\" would change the table or heading signature";
        return step;
    }
    step.text = std::move(moved);
    return step;
}

FixApplicator::StepResult FixApplicator::renameHeading(const std::string& source, const RenameHeadingFix& fix) const {
    StepResult step;
    if (fix.newRaw.empty() || fix.newRaw == fix.oldRaw) {
        step.detail = "replacement heading is empty or unchanged";
        return step;
    }

    Document doc = DocumentParser::Parse(source);
    const size_t wanted = fix.line > 0 ? fix.line - 1 : 0;
    const domain::document::Section* target = nullptr;
    size_t bestDistance = 0;
    for (const auto& section : doc.sections) {
        if (section.rawHeading != fix.oldRaw) continue;
        const size_t distance = section.headingLine > wanted ? section.headingLine - wanted : wanted - section.headingLine;
        if (!target || distance < bestDistance) {
            target = &section;
            bestDistance = distance;
        }
    }
    if (!target) {
        step.detail = "heading \"" + fix.oldRaw + "\" not found";
        return step;
    }

    doc.replaceLine(target->headingLine, fix.newRaw);
    step.text = doc.text();
    return step;
}

} // namespace structaudit::application
