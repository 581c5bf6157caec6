/**
 * @file Digest.cpp
 * @brief OpenSSL EVP digest implementation
 */

#include "services/Digest.hpp"

#include "util/IoHelpers.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <format>
#include <vector>

namespace digest {

namespace {

auto evp_for(HashAlgorithm algorithm) -> const EVP_MD* {
    switch (algorithm) {
        case HashAlgorithm::SHA256:
            return EVP_sha256();
        case HashAlgorithm::SHA1:
            return EVP_sha1();
        case HashAlgorithm::MD5:
            return EVP_md5();
    }
    return nullptr;
}

auto openssl_error(std::string_view what) -> util::Error {
    std::array<char, 256> buffer{};
    const unsigned long code = ERR_get_error();
    if (code != 0) {
        ERR_error_string_n(code, buffer.data(), buffer.size());
    }
    return util::Error{std::format("{}: {}", what, code != 0 ? buffer.data() : "unknown error"),
                       0, util::ErrorKind::HashCalculation};
}

}  // namespace

void Hasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

auto algorithm_name(HashAlgorithm algorithm) -> std::string_view {
    switch (algorithm) {
        case HashAlgorithm::SHA256:
            return "sha256";
        case HashAlgorithm::SHA1:
            return "sha1";
        case HashAlgorithm::MD5:
            return "md5";
    }
    return "sha256";
}

auto parse_algorithm(std::string_view text) -> std::optional<HashAlgorithm> {
    std::string normalized;
    for (const char c : text) {
        if (c != '-' && c != '_') {
            normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (normalized == "sha256") {
        return HashAlgorithm::SHA256;
    }
    if (normalized == "sha1") {
        return HashAlgorithm::SHA1;
    }
    if (normalized == "md5") {
        return HashAlgorithm::MD5;
    }
    return std::nullopt;
}

auto hex_length(HashAlgorithm algorithm) -> size_t {
    switch (algorithm) {
        case HashAlgorithm::SHA256:
            return 64;
        case HashAlgorithm::SHA1:
            return 40;
        case HashAlgorithm::MD5:
            return 32;
    }
    return 0;
}

auto adaptive_buffer_size(uint64_t file_size) -> size_t {
    if (file_size < SMALL_FILE_LIMIT) {
        return SMALL_FILE_BUFFER;
    }
    if (file_size < MEDIUM_FILE_LIMIT) {
        return MEDIUM_FILE_BUFFER;
    }
    return LARGE_FILE_BUFFER;
}

auto effective_buffer_size(uint64_t file_size, size_t override_bytes) -> size_t {
    if (override_bytes == 0) {
        return adaptive_buffer_size(file_size);
    }
    return std::clamp(override_bytes, MIN_BUFFER_OVERRIDE, MAX_BUFFER_OVERRIDE);
}

auto to_hex(std::span<const unsigned char> bytes) -> std::string {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (const unsigned char byte : bytes) {
        hex += DIGITS[byte >> 4];
        hex += DIGITS[byte & 0x0f];
    }
    return hex;
}

// ============================================================================
// Hasher
// ============================================================================

auto Hasher::create(HashAlgorithm algorithm) -> std::expected<Hasher, util::Error> {
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        return std::unexpected(openssl_error("EVP_MD_CTX_new failed"));
    }
    if (EVP_DigestInit_ex(ctx.get(), evp_for(algorithm), nullptr) != 1) {
        return std::unexpected(openssl_error(
            std::format("Cannot initialize {} digest", algorithm_name(algorithm))));
    }
    return Hasher{algorithm, std::move(ctx)};
}

auto Hasher::update(std::span<const uint8_t> bytes) -> std::expected<void, util::Error> {
    if (!ctx_) {
        return std::unexpected(util::Error{"Digest already finalized", 0,
                                           util::ErrorKind::HashCalculation});
    }
    if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
        return std::unexpected(openssl_error("EVP_DigestUpdate failed"));
    }
    return {};
}

auto Hasher::finish() -> std::expected<std::string, util::Error> {
    if (!ctx_) {
        return std::unexpected(util::Error{"Digest already finalized", 0,
                                           util::ErrorKind::HashCalculation});
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), md.data(), &length) != 1) {
        return std::unexpected(openssl_error("EVP_DigestFinal_ex failed"));
    }
    ctx_.reset();
    return to_hex(std::span<const unsigned char>{md.data(), length});
}

auto hash_bytes(HashAlgorithm algorithm, std::span<const uint8_t> bytes)
    -> std::expected<std::string, util::Error> {
    auto hasher = Hasher::create(algorithm);
    if (!hasher) {
        return std::unexpected(hasher.error());
    }
    if (auto updated = hasher->update(bytes); !updated) {
        return std::unexpected(updated.error());
    }
    return hasher->finish();
}

// ============================================================================
// Streaming
// ============================================================================

auto hash_descriptor(int fd, HashAlgorithm algorithm, const StreamOptions& options)
    -> std::expected<StreamDigest, util::Error> {
    auto hasher = Hasher::create(algorithm);
    if (!hasher) {
        return std::unexpected(hasher.error());
    }

    std::vector<uint8_t> buffer(std::max<size_t>(options.buffer_size, MIN_BUFFER_OVERRIDE));
    StreamDigest result;

    while (true) {
        if (options.cancel_flag != nullptr && options.cancel_flag->load()) {
            return std::unexpected(util::cancelled_error("Hashing"));
        }
        if (options.deadline && std::chrono::steady_clock::now() > *options.deadline) {
            return std::unexpected(util::Error{"Hashing timed out", ETIMEDOUT,
                                               util::ErrorKind::HashCalculation});
        }

        const auto got = util::read_with_retry(fd, buffer.data(), buffer.size());
        if (got < 0) {
            return std::unexpected(util::errno_error("Read failed", util::ErrorKind::HashCalculation));
        }
        if (got == 0) {
            break;
        }

        const auto chunk = std::span<const uint8_t>{buffer.data(), static_cast<size_t>(got)};
        if (auto updated = hasher->update(chunk); !updated) {
            return std::unexpected(updated.error());
        }
        result.bytes_read += chunk.size();
        if (options.on_bytes) {
            options.on_bytes(chunk.size());
        }
    }

    auto hex = hasher->finish();
    if (!hex) {
        return std::unexpected(hex.error());
    }
    result.digest_hex = std::move(*hex);
    return result;
}

}  // namespace digest
