/**
 * @file capability_context.hpp
 * @brief Explicit record of what the execution host can do
 *
 * The container engine is probed once at startup. Afterwards the flag only
 * changes through the retry-once-then-degrade policy: when a container run
 * fails, the executor asks for one re-probe; if the engine still answers
 * the run is retried once, otherwise the flag is cleared and later
 * requests go straight to the fallback executor.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <functional>

namespace codesmarty {
namespace core {

/**
 * @class CapabilityContext
 * @brief Shared, thread-safe container-engine availability flag
 *
 * **Thread Safety**: All methods may be called concurrently. The flag is
 * the only state shared between request workers.
 */
class CapabilityContext {
public:
    using Probe = std::function<bool()>;

    /**
     * @brief Run @p probe once and remember the answer
     */
    explicit CapabilityContext(Probe probe);

    CapabilityContext(const CapabilityContext&) = delete;
    CapabilityContext& operator=(const CapabilityContext&) = delete;

    /// Current view of the container engine
    bool EngineAvailable() const { return engine_available_.load(); }

    /**
     * @brief Probe again after a failed run
     * @return True if the engine still answers (caller retries once);
     *         false clears the flag
     */
    bool Reprobe();

private:
    Probe probe_;
    std::atomic<bool> engine_available_;
};

} // namespace core
} // namespace codesmarty
