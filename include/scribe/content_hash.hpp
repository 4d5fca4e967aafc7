#pragma once

#include <scribe/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace scribe {

using Digest = std::array<uint8_t, 32>;

// Streaming SHA-256 (FIPS 180-4)
class SHA256 {
public:
    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Object should not be reused after this call.
    Digest finalize();

    static std::string to_hex(const Digest& digest);

private:
    void compress(const uint8_t block[64]);

    std::array<uint32_t, 8> state_;
    uint64_t total_bytes_ = 0;
    uint8_t  buffer_[64];
    size_t   buffer_len_ = 0;
};

// Content fingerprints for version snapshots: lowercase hex SHA-256 of the
// raw UTF-8 bytes. Nothing but the content goes into the hash.
class ContentHasher {
public:
    static constexpr size_t kFingerprintLength = 64;

    // Fails with Encoding when content is not well-formed UTF-8
    static Result<std::string> hash(const std::string& content);

    // Recompute-and-compare check used when loading persisted versions
    static bool verify(const std::string& content, const std::string& fingerprint);

    static Status validate_utf8(const std::string& content);
};

} // namespace scribe
