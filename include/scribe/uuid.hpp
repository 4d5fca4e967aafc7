#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace scribe {

// Random identifiers for artifacts, versions and benchmark runs
struct Uuid {
    std::array<uint8_t, 16> bytes;

    static Uuid v4();
    std::string to_string() const;
};

// Shorthand for Uuid::v4().to_string()
std::string new_id();

} // namespace scribe
