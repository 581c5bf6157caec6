/**
 * @file RandomBuffer.hpp
 * @brief Fast pseudo-random fill for probe payloads
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <random>
#include <span>

namespace util {

/**
 * @brief Fill a byte range with pseudo-random data
 *
 * The data only has to defeat compression and deduplication in the storage
 * stack, so a thread-local 64-bit Mersenne engine is enough.
 */
inline void fill_random(std::span<uint8_t> bytes) {
    thread_local std::mt19937_64 generator{std::random_device{}()};

    size_t offset = 0;
    while (offset + sizeof(uint64_t) <= bytes.size()) {
        const uint64_t value = generator();
        std::memcpy(bytes.data() + offset, &value, sizeof(value));
        offset += sizeof(value);
    }
    if (offset < bytes.size()) {
        const uint64_t tail = generator();
        std::memcpy(bytes.data() + offset, &tail, bytes.size() - offset);
    }
}

}  // namespace util
