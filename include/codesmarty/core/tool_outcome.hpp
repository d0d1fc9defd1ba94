/**
 * @file tool_outcome.hpp
 * @brief Explicit result type for operations that may degrade
 *
 * Anything that depends on an external capability (a command-line tool,
 * the container engine, the generative backend) reports through
 * ToolOutcome instead of throwing. Callers pick their fallback with
 * OrElse()/ValueOr(), so every degradation is a visible branch.
 *
 * **Usage Example**:
 * @code
 * auto language = backend.Generate(request)
 *     .Map(ParseAnswer)
 *     .OrElse([&](const std::string& reason) {
 *         spdlog::warn("Classifier unavailable: {}", reason);
 *         return DetectWithRules(code);
 *     });
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <utility>
#include <stdexcept>
#include <type_traits>

namespace codesmarty {
namespace core {

/**
 * @enum OutcomeKind
 * @brief Discriminator of a ToolOutcome
 */
enum class OutcomeKind {
    OK,            ///< Operation produced a value
    UNAVAILABLE,   ///< Capability missing (tool not on PATH, engine down, no backend)
    FAILED         ///< Capability present but the operation failed
};

/**
 * @class ToolOutcome
 * @brief Ok(value) | Unavailable(reason) | Failed(reason)
 */
template <typename T>
class ToolOutcome {
public:
    static ToolOutcome Ok(T value) {
        return ToolOutcome(OutcomeKind::OK, std::move(value), {});
    }

    static ToolOutcome Unavailable(std::string reason) {
        return ToolOutcome(OutcomeKind::UNAVAILABLE, T{}, std::move(reason));
    }

    static ToolOutcome Failed(std::string reason) {
        return ToolOutcome(OutcomeKind::FAILED, T{}, std::move(reason));
    }

    OutcomeKind Kind() const { return kind_; }
    bool IsOk() const { return kind_ == OutcomeKind::OK; }
    bool IsUnavailable() const { return kind_ == OutcomeKind::UNAVAILABLE; }
    bool IsFailed() const { return kind_ == OutcomeKind::FAILED; }

    /**
     * @brief Access the value
     * @throws std::logic_error if the outcome is not OK
     */
    const T& Value() const {
        if (!IsOk()) {
            throw std::logic_error("ToolOutcome has no value: " + reason_);
        }
        return value_;
    }

    /// Reason for UNAVAILABLE / FAILED (empty when OK)
    const std::string& Reason() const { return reason_; }

    T ValueOr(T fallback) const {
        return IsOk() ? value_ : std::move(fallback);
    }

    /**
     * @brief Return the value, or the result of @p fallback(reason)
     */
    template <typename F>
    T OrElse(F&& fallback) const {
        if (IsOk()) {
            return value_;
        }
        return std::forward<F>(fallback)(reason_);
    }

    /**
     * @brief Transform the value, preserving UNAVAILABLE / FAILED
     */
    template <typename F>
    auto Map(F&& fn) const -> ToolOutcome<std::decay_t<decltype(fn(std::declval<const T&>()))>> {
        using U = std::decay_t<decltype(fn(std::declval<const T&>()))>;
        switch (kind_) {
            case OutcomeKind::OK: return ToolOutcome<U>::Ok(std::forward<F>(fn)(value_));
            case OutcomeKind::UNAVAILABLE: return ToolOutcome<U>::Unavailable(reason_);
            case OutcomeKind::FAILED: return ToolOutcome<U>::Failed(reason_);
        }
        return ToolOutcome<U>::Failed(reason_);
    }

private:
    ToolOutcome(OutcomeKind kind, T value, std::string reason)
        : kind_(kind), value_(std::move(value)), reason_(std::move(reason)) {}

    OutcomeKind kind_;
    T value_;
    std::string reason_;
};

} // namespace core
} // namespace codesmarty
