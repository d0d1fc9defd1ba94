/**
 * @file analysis_types.cpp
 * @brief Pipeline record helpers
 *
 * @date 2025
 */

#include "codesmarty/core/analysis_types.hpp"
#include "codesmarty/utils/hash_utils.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <algorithm>

namespace codesmarty {
namespace core {

CodeSubmission::CodeSubmission(std::string code,
                               SubmissionOrigin origin,
                               std::string origin_path)
    : code_(std::move(code))
    , origin_(origin)
    , origin_path_(std::move(origin_path))
    , id_(utils::HashUtils::ComputeSHA256(code_)) {
}

bool CodeSubmission::IsBlank() const {
    return utils::StringUtils::Trim(code_).empty();
}

void FindingSet::Set(const std::string& source, const std::string& report) {
    auto it = std::find_if(findings_.begin(), findings_.end(),
                           [&](const Finding& f) { return f.source == source; });
    if (it != findings_.end()) {
        it->report = report;
        return;
    }
    findings_.push_back(Finding{source, report});
}

std::optional<std::string> FindingSet::Get(const std::string& source) const {
    for (const auto& finding : findings_) {
        if (finding.source == source) {
            return finding.report;
        }
    }
    return std::nullopt;
}

bool FindingSet::Contains(const std::string& source) const {
    return Get(source).has_value();
}

bool FindingSet::operator==(const FindingSet& other) const {
    if (findings_.size() != other.findings_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < findings_.size(); ++i) {
        if (findings_[i].source != other.findings_[i].source ||
            findings_[i].report != other.findings_[i].report) {
            return false;
        }
    }
    return true;
}

std::string SubmissionOriginToString(SubmissionOrigin origin) {
    switch (origin) {
        case SubmissionOrigin::INLINE_SNIPPET: return "snippet";
        case SubmissionOrigin::LOCAL_FILE: return "file";
        case SubmissionOrigin::REPOSITORY_FILE: return "repository file";
    }
    return "snippet";
}

std::string ExecutionModeToString(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::SANDBOXED: return "sandboxed";
        case ExecutionMode::FALLBACK_SIMULATED: return "fallback-simulated";
        case ExecutionMode::UNSUPPORTED: return "unsupported";
    }
    return "unsupported";
}

std::string ProvenanceToString(Provenance provenance) {
    switch (provenance) {
        case Provenance::GENERATED: return "generated";
        case Provenance::FALLBACK_TEMPLATE: return "fallback-template";
    }
    return "fallback-template";
}

} // namespace core
} // namespace codesmarty
