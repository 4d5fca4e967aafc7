#include <scribe/content_hash.hpp>
#include <algorithm>
#include <cstring>

namespace scribe {

// ---------------------------------------------------------------------------
// SHA-256
// ---------------------------------------------------------------------------

// First 32 bits of the fractional parts of the cube roots of the first
// 64 primes (FIPS 180-4 section 4.2.2).
static constexpr uint32_t kRoundConstants[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

static inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

static inline uint32_t load_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16)
         | (uint32_t(p[2]) << 8)  |  uint32_t(p[3]);
}

static inline void store_be32(uint8_t* p, uint32_t v) {
    for (int i = 3; i >= 0; --i) {
        p[i] = uint8_t(v);
        v >>= 8;
    }
}

SHA256::SHA256()
    : state_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
             0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19} {}

void SHA256::compress(const uint8_t block[64]) {
    uint32_t w[64];
    for (int t = 0; t < 16; ++t) {
        w[t] = load_be32(block + 4 * t);
    }
    for (int t = 16; t < 64; ++t) {
        uint32_t s0 = rotr(w[t-15], 7) ^ rotr(w[t-15], 18) ^ (w[t-15] >> 3);
        uint32_t s1 = rotr(w[t-2], 17) ^ rotr(w[t-2], 19) ^ (w[t-2] >> 10);
        w[t] = w[t-16] + s0 + w[t-7] + s1;
    }

    // v[0..7] = a..h
    std::array<uint32_t, 8> v = state_;
    for (int t = 0; t < 64; ++t) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        uint32_t choose = (e & v[5]) ^ (~e & v[6]);
        uint32_t t1 = v[7] + s1 + choose + kRoundConstants[t] + w[t];
        uint32_t s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        uint32_t majority = (a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]);
        uint32_t t2 = s0 + majority;

        for (int i = 7; i > 0; --i) v[i] = v[i - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (int i = 0; i < 8; ++i) {
        state_[i] += v[i];
    }
}

void SHA256::update(const uint8_t* data, size_t len) {
    total_bytes_ += len;

    while (len > 0) {
        if (buffer_len_ == 0 && len >= 64) {
            compress(data);
            data += 64;
            len -= 64;
            continue;
        }
        size_t take = std::min(len, 64 - buffer_len_);
        std::memcpy(buffer_ + buffer_len_, data, take);
        buffer_len_ += take;
        data += take;
        len -= take;
        if (buffer_len_ == 64) {
            compress(buffer_);
            buffer_len_ = 0;
        }
    }
}

void SHA256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

Digest SHA256::finalize() {
    const uint64_t total_bits = total_bytes_ * 8;

    // 0x80 terminator, zero fill to 56 mod 64, then the bit length
    buffer_[buffer_len_++] = 0x80;
    if (buffer_len_ > 56) {
        std::memset(buffer_ + buffer_len_, 0, 64 - buffer_len_);
        compress(buffer_);
        buffer_len_ = 0;
    }
    std::memset(buffer_ + buffer_len_, 0, 56 - buffer_len_);
    store_be32(buffer_ + 56, static_cast<uint32_t>(total_bits >> 32));
    store_be32(buffer_ + 60, static_cast<uint32_t>(total_bits));
    compress(buffer_);
    buffer_len_ = 0;

    Digest digest;
    for (int i = 0; i < 8; ++i) {
        store_be32(digest.data() + 4 * i, state_[i]);
    }
    return digest;
}

std::string SHA256::to_hex(const Digest& digest) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(64);
    for (uint8_t b : digest) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0f];
    }
    return out;
}

// ---------------------------------------------------------------------------
// ContentHasher
// ---------------------------------------------------------------------------

Status ContentHasher::validate_utf8(const std::string& content) {
    const auto* p = reinterpret_cast<const unsigned char*>(content.data());
    const size_t n = content.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = p[i];
        size_t extra;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return ScribeError{ScribeError::Encoding,
                "invalid UTF-8 lead byte at offset " + std::to_string(i)};
        }

        if (i + extra >= n) {
            return ScribeError{ScribeError::Encoding,
                "truncated UTF-8 sequence at offset " + std::to_string(i)};
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = p[i + k];
            if ((cc & 0xC0) != 0x80) {
                return ScribeError{ScribeError::Encoding,
                    "invalid UTF-8 continuation byte at offset " + std::to_string(i + k)};
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and values beyond U+10FFFF
        static const uint32_t min_for_len[4] = {0, 0x80, 0x800, 0x10000};
        if (cp < min_for_len[extra] || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return ScribeError{ScribeError::Encoding,
                "invalid UTF-8 code point at offset " + std::to_string(i)};
        }
        i += extra + 1;
    }
    return ok_status();
}

Result<std::string> ContentHasher::hash(const std::string& content) {
    SCRIBE_TRY(validate_utf8(content));
    SHA256 ctx;
    ctx.update(content);
    return Result<std::string>::ok(SHA256::to_hex(ctx.finalize()));
}

bool ContentHasher::verify(const std::string& content, const std::string& fingerprint) {
    if (fingerprint.size() != kFingerprintLength) return false;
    auto h = hash(content);
    return h.is_ok() && h.value() == fingerprint;
}

} // namespace scribe
