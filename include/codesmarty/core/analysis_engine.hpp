/**
 * @file analysis_engine.hpp
 * @brief Orchestrates the analysis pipeline for snippets and repositories
 *
 * **Pipeline** (one submission):
 * ```
 * code ─► reject blank ─► detect language ─► reject UNKNOWN
 *      ─► static analysis ─► execution (sandbox or fallback)
 *      ─► suggestion synthesis ─► AnalysisResult
 * ```
 *
 * **Repository Workflow**:
 * ```
 * reference ─► normalize ─► shallow clone into a temp workspace
 *           ─► walk supported files ─► pipeline per file
 *           ─► RepositoryResult (one entry per file, failures isolated)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/analysis_types.hpp"
#include "codesmarty/core/capability_context.hpp"
#include "codesmarty/core/config.hpp"
#include "codesmarty/clients/generative_backend.hpp"
#include "codesmarty/utils/process_utils.hpp"

#include <memory>
#include <string>

namespace codesmarty {
namespace core {

/**
 * @class AnalysisEngine
 * @brief The only component that knows the full pipeline sequence
 *
 * All external collaborators come in through the constructor: the command
 * runner (linters, compilers, docker, git), the generative backend and the
 * shared capability context.
 *
 * **Thread Safety**: AnalyzeCode() and AnalyzeRepository() may be called
 * concurrently from the HTTP worker pool.
 *
 * **Usage Example**:
 * @code
 * utils::SystemCommandRunner runner;
 * clients::GeminiClient gemini(host, model, key);
 * utils::ContainerUtils docker(runner);
 * CapabilityContext capabilities([&] { return docker.IsRuntimeAvailable(); });
 *
 * AnalysisEngine engine(config, runner, gemini, capabilities);
 * auto result = engine.AnalyzeCode("def hello():\n    print('hi')\n");
 * @endcode
 */
class AnalysisEngine {
public:
    AnalysisEngine(const AppConfig& config,
                   utils::CommandRunner& runner,
                   clients::GenerativeBackend& backend,
                   CapabilityContext& capabilities);

    ~AnalysisEngine();

    AnalysisEngine(const AnalysisEngine&) = delete;
    AnalysisEngine& operator=(const AnalysisEngine&) = delete;

    /**
     * @brief Run the pipeline on one submission
     * @throws InputError if the code is blank or its language is unresolved
     */
    AnalysisResult AnalyzeSubmission(const CodeSubmission& submission);

    /**
     * @brief Run the pipeline on an inline snippet
     * @throws InputError if the code is blank or its language is unresolved
     */
    AnalysisResult AnalyzeCode(const std::string& code);

    /**
     * @brief Clone a repository and analyze every supported file
     *
     * A failure in one file becomes an ErrorEntry for that path; the walk
     * continues. The workspace is removed before returning.
     *
     * @throws InputError if the reference is malformed
     * @throws CloneError if the clone fails
     */
    RepositoryResult AnalyzeRepository(const std::string& reference);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace codesmarty
