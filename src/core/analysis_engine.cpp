/**
 * @file analysis_engine.cpp
 * @brief Orchestrates the analysis pipeline for snippets and repositories
 *
 * @date 2025
 */

#include "codesmarty/core/analysis_engine.hpp"
#include "codesmarty/core/errors.hpp"
#include "codesmarty/core/fallback_executor.hpp"
#include "codesmarty/core/repository_manager.hpp"
#include "codesmarty/core/sandbox_engine.hpp"
#include "codesmarty/analyzers/language_detector.hpp"
#include "codesmarty/analyzers/static_analyzer.hpp"
#include "codesmarty/analyzers/suggestion_synthesizer.hpp"
#include "codesmarty/utils/hash_utils.hpp"
#include "codesmarty/utils/temp_resource.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace codesmarty {
namespace core {

namespace {

std::string ReadSourceFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

// ============================================================================
// IMPLEMENTATION DETAILS
// ============================================================================

class AnalysisEngine::Impl {
public:
    Impl(const AppConfig& config,
         utils::CommandRunner& runner,
         clients::GenerativeBackend& backend,
         CapabilityContext& capabilities)
        : language_detector(backend, config.unmatched_default)
        , static_analyzer(runner, analyzers::StaticAnalyzer::Config{config.tools.tool_timeout,
                                                                    config.tools.valgrind_timeout})
        , fallback_executor(runner, config.tools.tool_timeout)
        , sandbox_engine(runner, capabilities, fallback_executor, config.sandbox)
        , suggestion_synthesizer(backend, config.generative.max_output_tokens)
        , repository_manager(runner, RepositoryManager::Config{config.repository.clone_timeout}) {
    }

    analyzers::LanguageDetector language_detector;
    analyzers::StaticAnalyzer static_analyzer;
    FallbackExecutor fallback_executor;
    SandboxEngine sandbox_engine;
    analyzers::SuggestionSynthesizer suggestion_synthesizer;
    RepositoryManager repository_manager;
};

AnalysisEngine::AnalysisEngine(const AppConfig& config,
                               utils::CommandRunner& runner,
                               clients::GenerativeBackend& backend,
                               CapabilityContext& capabilities)
    : impl_(std::make_unique<Impl>(config, runner, backend, capabilities)) {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("CODE-SMARTY Analysis Engine");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Sandbox: {}", config.sandbox.enabled ? "enabled" : "disabled");
    spdlog::info("Generative model: {}", config.generative.model);
}

AnalysisEngine::~AnalysisEngine() = default;

// ============================================================================
// SINGLE SUBMISSION
// ============================================================================

AnalysisResult AnalysisEngine::AnalyzeSubmission(const CodeSubmission& submission) {
    if (submission.IsBlank()) {
        throw InputError("No code provided");
    }

    AnalysisResult result;
    result.submission_id = submission.Id();
    result.origin_path = submission.OriginPath();

    spdlog::info("Analyzing {} {}{}", SubmissionOriginToString(submission.Origin()),
                 utils::HashUtils::ShortId(submission.Id()),
                 submission.OriginPath().empty() ? "" : " (" + submission.OriginPath() + ")");

    // PHASE 1: LANGUAGE DETECTION
    spdlog::info("[1/4] LANGUAGE DETECTION");
    result.language = impl_->language_detector.Detect(submission.Code());
    if (result.language == Language::UNKNOWN) {
        throw InputError("Could not determine the programming language of the submitted code");
    }

    // PHASE 2: STATIC ANALYSIS
    spdlog::info("[2/4] STATIC ANALYSIS");
    result.findings = impl_->static_analyzer.Analyze(submission.Code(), result.language);

    // PHASE 3: EXECUTION
    spdlog::info("[3/4] EXECUTION");
    result.runtime = impl_->sandbox_engine.Execute(submission.Code(), result.language);
    spdlog::info("Execution mode: {}", ExecutionModeToString(result.runtime.mode));

    // PHASE 4: SUGGESTIONS
    spdlog::info("[4/4] SUGGESTION SYNTHESIS");
    result.suggestions = impl_->suggestion_synthesizer.Synthesize(
        submission.Code(), result.findings, result.runtime, result.language);
    spdlog::info("Suggestions: {}", ProvenanceToString(result.suggestions.provenance));

    return result;
}

AnalysisResult AnalysisEngine::AnalyzeCode(const std::string& code) {
    return AnalyzeSubmission(CodeSubmission(code, SubmissionOrigin::INLINE_SNIPPET));
}

// ============================================================================
// REPOSITORY
// ============================================================================

RepositoryResult AnalysisEngine::AnalyzeRepository(const std::string& reference) {
    const std::string url = RepositoryManager::NormalizeRepositoryUrl(reference);

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("REPOSITORY ANALYSIS: {}", url);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    utils::TempDirectory workspace("codesmarty_clone_");
    impl_->repository_manager.Clone(url, workspace.Path());

    RepositoryResult results;
    auto files = RepositoryManager::CollectSourceFiles(workspace.Path());

    std::size_t index = 0;
    for (const auto& file : files) {
        ++index;
        spdlog::info("[{}/{}] {}", index, files.size(), file.relative_path);

        FileAnalysis entry;
        try {
            CodeSubmission submission(ReadSourceFile(file.absolute_path),
                                      SubmissionOrigin::REPOSITORY_FILE,
                                      file.relative_path);
            entry.result = AnalyzeSubmission(submission);
        }
        catch (const std::exception& e) {
            spdlog::error("Analysis of {} failed: {}", file.relative_path, e.what());
            entry.error = ErrorEntry{e.what()};
        }
        results.emplace(file.relative_path, std::move(entry));
    }

    auto failures = std::count_if(results.begin(), results.end(),
                                  [](const auto& item) { return item.second.IsError(); });
    spdlog::info("Repository analysis complete: {} file(s), {} failure(s)", results.size(), failures);
    return results;
}

} // namespace core
} // namespace codesmarty
