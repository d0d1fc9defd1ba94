/**
 * @file capability_context.cpp
 * @brief Container-engine availability flag
 *
 * @date 2025
 */

#include "codesmarty/core/capability_context.hpp"

#include <spdlog/spdlog.h>

namespace codesmarty {
namespace core {

CapabilityContext::CapabilityContext(Probe probe)
    : probe_(std::move(probe))
    , engine_available_(probe_ ? probe_() : false) {
    if (engine_available_) {
        spdlog::info("✓ Container engine available: sandboxed execution enabled");
    } else {
        spdlog::warn("Container engine unavailable: execution falls back to static simulation");
    }
}

bool CapabilityContext::Reprobe() {
    bool available = probe_ ? probe_() : false;
    if (!available && engine_available_.exchange(false)) {
        spdlog::warn("Container engine no longer reachable, degrading to fallback execution");
    }
    return available;
}

} // namespace core
} // namespace codesmarty
