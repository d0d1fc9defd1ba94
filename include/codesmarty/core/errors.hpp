/**
 * @file errors.hpp
 * @brief Request-level error types
 *
 * Only failures that end a request are exceptions. Missing tools, an
 * unreachable container engine and backend failures are not errors; they
 * travel as ToolOutcome values and sentinel strings.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace codesmarty {
namespace core {

/**
 * @class InputError
 * @brief Caller supplied something the pipeline refuses to analyze
 *
 * Empty code, an unresolved language, a malformed repository reference.
 * Mapped to HTTP 400; never retried.
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class CloneError
 * @brief Repository could not be cloned
 *
 * Mapped to HTTP 400 with the underlying git message.
 */
class CloneError : public std::runtime_error {
public:
    explicit CloneError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace core
} // namespace codesmarty
