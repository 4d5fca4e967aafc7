#pragma once

#include <scribe/result.hpp>
#include <string>

namespace scribe {

// Which component an automatic version increment touches
enum class Bump {
    Major,
    Minor,
    Patch,
};

// Semantic version of an artifact snapshot: major.minor.patch
struct SemVer {
    int major = 0;
    int minor = 0;
    int patch = 0;

    static Result<SemVer> parse(const std::string& s);
    std::string to_string() const;

    // Next version; lower components reset to zero. Fails with
    // VersionConflict when the bumped component is already INT_MAX.
    Result<SemVer> bumped(Bump which) const;

    // Version given to the first snapshot of an artifact
    static SemVer initial() { return SemVer{1, 0, 0}; }

    bool operator==(const SemVer& o) const;
    bool operator!=(const SemVer& o) const;
    bool operator<(const SemVer& o) const;
    bool operator<=(const SemVer& o) const;
    bool operator>(const SemVer& o) const;
    bool operator>=(const SemVer& o) const;
};

const char* bump_name(Bump b);

} // namespace scribe
