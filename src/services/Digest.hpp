/**
 * @file Digest.hpp
 * @brief Streaming message digests over OpenSSL EVP
 */

#pragma once

#include "models/OperationTypes.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace digest {

inline constexpr size_t SMALL_FILE_BUFFER = 256 * 1024;
inline constexpr size_t MEDIUM_FILE_BUFFER = 2 * 1024 * 1024;
inline constexpr size_t LARGE_FILE_BUFFER = 10 * 1024 * 1024;
inline constexpr uint64_t SMALL_FILE_LIMIT = 1'000'000;
inline constexpr uint64_t MEDIUM_FILE_LIMIT = 100'000'000;

inline constexpr size_t MIN_BUFFER_OVERRIDE = 8 * 1024;
inline constexpr size_t MAX_BUFFER_OVERRIDE = 10 * 1024 * 1024;

[[nodiscard]] auto algorithm_name(HashAlgorithm algorithm) -> std::string_view;

/**
 * @brief Accepts "sha256", "SHA-256", "sha1", "md5" and similar spellings
 */
[[nodiscard]] auto parse_algorithm(std::string_view text) -> std::optional<HashAlgorithm>;

/// Digest size in hex characters
[[nodiscard]] auto hex_length(HashAlgorithm algorithm) -> size_t;

/**
 * @brief Read buffer sized to the file: 256KB, 2MB or 10MB
 */
[[nodiscard]] auto adaptive_buffer_size(uint64_t file_size) -> size_t;

/**
 * @brief Buffer for a file given a user override (0 = adaptive)
 */
[[nodiscard]] auto effective_buffer_size(uint64_t file_size, size_t override_bytes) -> size_t;

[[nodiscard]] auto to_hex(std::span<const unsigned char> bytes) -> std::string;

/**
 * @class Hasher
 * @brief Incremental digest; one instance per stream
 */
class Hasher {
public:
    [[nodiscard]] static auto create(HashAlgorithm algorithm) -> std::expected<Hasher, util::Error>;

    Hasher(Hasher&&) noexcept = default;
    Hasher& operator=(Hasher&&) noexcept = default;
    ~Hasher() = default;

    auto update(std::span<const uint8_t> bytes) -> std::expected<void, util::Error>;

    /**
     * @brief Finalize and return lowercase hex; the hasher is spent afterwards
     */
    auto finish() -> std::expected<std::string, util::Error>;

    [[nodiscard]] auto algorithm() const -> HashAlgorithm { return algorithm_; }

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    Hasher(HashAlgorithm algorithm, std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx)
        : algorithm_(algorithm), ctx_(std::move(ctx)) {}

    HashAlgorithm algorithm_;
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

/**
 * @brief Digest of an in-memory buffer
 */
[[nodiscard]] auto hash_bytes(HashAlgorithm algorithm, std::span<const uint8_t> bytes)
    -> std::expected<std::string, util::Error>;

struct StreamOptions {
    size_t buffer_size = MEDIUM_FILE_BUFFER;
    const std::atomic<bool>* cancel_flag = nullptr;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::function<void(uint64_t)> on_bytes;  ///< Called with the size of each chunk read
};

struct StreamDigest {
    std::string digest_hex;
    uint64_t bytes_read = 0;
};

/**
 * @brief Digest an open descriptor from its current offset to EOF
 *
 * Cancellation and the deadline are checked between reads.
 */
[[nodiscard]] auto hash_descriptor(int fd, HashAlgorithm algorithm, const StreamOptions& options)
    -> std::expected<StreamDigest, util::Error>;

}  // namespace digest
