#include <scribe/uuid.hpp>
#include <cstdio>
#include <random>

namespace scribe {

// One engine per thread; ids are minted from concurrent writers
static std::mt19937_64& engine() {
    thread_local std::mt19937_64 gen = [] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }();
    return gen;
}

Uuid Uuid::v4() {
    Uuid u;
    auto& gen = engine();
    for (size_t i = 0; i < u.bytes.size(); i += 8) {
        uint64_t word = gen();
        for (size_t b = 0; b < 8; ++b) {
            u.bytes[i + b] = static_cast<uint8_t>(word >> (b * 8));
        }
    }
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;  // version 4
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant
    return u;
}

std::string Uuid::to_string() const {
    char buf[37];
    std::snprintf(buf, sizeof(buf),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
        bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
        bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf, 36);
}

std::string new_id() {
    return Uuid::v4().to_string();
}

} // namespace scribe
