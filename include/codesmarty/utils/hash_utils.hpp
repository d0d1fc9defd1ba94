/**
 * @file hash_utils.hpp
 * @brief SHA-256 helpers for submission identifiers
 *
 * A submission is identified by the SHA-256 of its code. The identifier
 * correlates log lines of one request and names the JSON report written
 * by the command-line front end.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace codesmarty {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed hashing
 *
 * **Usage Example**:
 * @code
 * std::string id = HashUtils::ComputeSHA256(code);
 * spdlog::info("Submission {}", HashUtils::ShortId(id));
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of an in-memory buffer as lowercase hex (64 characters)
     * @throws std::runtime_error if the OpenSSL digest fails
     */
    static std::string ComputeSHA256(const std::string& data);

    /// First 12 hex characters, for log lines
    static std::string ShortId(const std::string& hex_digest);
};

} // namespace utils
} // namespace codesmarty
