/**
 * @file hash_utils.cpp
 * @brief SHA-256 via the OpenSSL EVP interface
 *
 * **Error Handling**:
 * - OpenSSL errors: logged and rethrown as std::runtime_error
 *
 * @date 2025
 */

#include "codesmarty/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <sstream>
#include <iomanip>
#include <memory>
#include <stdexcept>

namespace codesmarty {
namespace utils {

namespace {

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("OpenSSL SHA-256 initialization failed");
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
    return ctx;
}

std::string FinishDigest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &length) != 1) {
        spdlog::error("OpenSSL SHA-256 finalization failed");
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    return BinaryToHex(hash, length);
}

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto ctx = NewSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
    return FinishDigest(ctx.get());
}

std::string HashUtils::ShortId(const std::string& hex_digest) {
    return hex_digest.substr(0, 12);
}

} // namespace utils
} // namespace codesmarty
