/**
 * @file analysis_types.hpp
 * @brief Records flowing through the analysis pipeline
 *
 * Raw code → Language → FindingSet → ExecutionOutcome → SuggestionReport →
 * AnalysisResult. All records are created and consumed within a single
 * request.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>

#include "codesmarty/core/language.hpp"

namespace codesmarty {
namespace core {

/// Report value for a tool that is not resolvable on the execution host
inline const std::string kToolNotAvailable = "Tool not available";

/// Report value for a tool that ran and reported nothing
inline const std::string kNoIssuesFound = "No issues found";

/// Report value for a conceptual scan with no matching rule
inline const std::string kNoConceptualIssues = "No conceptual issues detected.";

/// FindingSet key of the rule-engine entry
inline const std::string kConceptualErrorsKey = "conceptual_errors";

/// Label that prefixes every fallback-simulated execution payload
inline const std::string kSimulatedLabel =
    "[SIMULATED] Code was not executed; static approximation only.";

/**
 * @enum SubmissionOrigin
 * @brief Where a submission came from
 */
enum class SubmissionOrigin {
    INLINE_SNIPPET,    ///< Posted directly as text
    LOCAL_FILE,        ///< A file named on the command line
    REPOSITORY_FILE    ///< A file discovered in a cloned repository
};

std::string SubmissionOriginToString(SubmissionOrigin origin);

/**
 * @class CodeSubmission
 * @brief Immutable piece of code handed to the pipeline
 */
class CodeSubmission {
public:
    explicit CodeSubmission(std::string code,
                            SubmissionOrigin origin = SubmissionOrigin::INLINE_SNIPPET,
                            std::string origin_path = {});

    const std::string& Code() const { return code_; }
    SubmissionOrigin Origin() const { return origin_; }

    /// Repository-relative or local file path (empty for inline snippets)
    const std::string& OriginPath() const { return origin_path_; }

    /// SHA-256 of the code, used as the submission identifier in logs
    const std::string& Id() const { return id_; }

    /// True if the code is empty or whitespace only
    bool IsBlank() const;

private:
    std::string code_;
    SubmissionOrigin origin_;
    std::string origin_path_;
    std::string id_;
};

/**
 * @struct Finding
 * @brief One named report inside a FindingSet
 */
struct Finding {
    std::string source;   ///< Tool or rule-engine name (e.g. "cppcheck", "conceptual_errors")
    std::string report;   ///< Diagnostic text or a sentinel value
};

/**
 * @class FindingSet
 * @brief Insertion-ordered mapping from tool name to textual report
 *
 * Setting an existing source replaces its report in place so ordering
 * reflects the first time a source reported.
 */
class FindingSet {
public:
    void Set(const std::string& source, const std::string& report);

    std::optional<std::string> Get(const std::string& source) const;

    bool Contains(const std::string& source) const;

    bool Empty() const { return findings_.empty(); }
    std::size_t Size() const { return findings_.size(); }

    const std::vector<Finding>& Entries() const { return findings_; }

    bool operator==(const FindingSet& other) const;

private:
    std::vector<Finding> findings_;
};

/**
 * @enum ExecutionMode
 * @brief How the runtime outcome was obtained
 */
enum class ExecutionMode {
    SANDBOXED,            ///< Actually executed inside a container
    FALLBACK_SIMULATED,   ///< Static approximation, code never ran
    UNSUPPORTED           ///< Language has no execution strategy
};

std::string ExecutionModeToString(ExecutionMode mode);

/**
 * @struct ExecutionOutcome
 * @brief Result of running (or simulating) a submission
 *
 * Always produced: execution degrades to fallback instead of failing.
 */
struct ExecutionOutcome {
    ExecutionMode mode{ExecutionMode::FALLBACK_SIMULATED};  ///< Execution mode
    std::string output;                                     ///< Merged stdout/stderr or simulated warnings
    bool success{false};                                    ///< Run (or simulation) found no problem
    int exit_code{0};                                       ///< Process exit code (sandboxed only)
    bool timed_out{false};                                  ///< Wall-clock bound hit (sandboxed only)
};

/**
 * @enum Provenance
 * @brief Origin of a suggestion report
 */
enum class Provenance {
    GENERATED,           ///< Written by the generative backend
    FALLBACK_TEMPLATE    ///< Assembled deterministically from findings
};

std::string ProvenanceToString(Provenance provenance);

/**
 * @struct SuggestionReport
 * @brief Remediation text plus where it came from
 */
struct SuggestionReport {
    std::string text;
    Provenance provenance{Provenance::FALLBACK_TEMPLATE};
};

/**
 * @struct AnalysisResult
 * @brief Terminal record for one submission
 */
struct AnalysisResult {
    std::string submission_id;                   ///< SHA-256 of the code
    std::string origin_path;                     ///< Repository-relative path, if any
    Language language{Language::UNKNOWN};        ///< Resolved language
    FindingSet findings;                         ///< Static-analysis findings
    ExecutionOutcome runtime;                    ///< Execution / simulation outcome
    SuggestionReport suggestions;                ///< Synthesized remediation report
};

/**
 * @struct ErrorEntry
 * @brief Per-file failure recorded during a repository walk
 */
struct ErrorEntry {
    std::string message;
};

/**
 * @struct FileAnalysis
 * @brief Either an AnalysisResult or an ErrorEntry for one repository file
 */
struct FileAnalysis {
    std::optional<AnalysisResult> result;
    std::optional<ErrorEntry> error;

    bool IsError() const { return error.has_value(); }
};

/// Relative path → per-file analysis (paths are unique keys)
using RepositoryResult = std::map<std::string, FileAnalysis>;

} // namespace core
} // namespace codesmarty
