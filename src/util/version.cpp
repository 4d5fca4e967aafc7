#include <scribe/version.hpp>
#include <cctype>
#include <climits>

namespace scribe {

// Parse one dot-separated numeric component. Leading zeros are rejected
// ("01") so that every version has exactly one spelling.
static bool parse_component(const std::string& s, size_t begin, size_t end, int& out) {
    if (begin >= end) return false;
    if (end - begin > 1 && s[begin] == '0') return false;

    long long value = 0;
    for (size_t i = begin; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        value = value * 10 + (s[i] - '0');
        if (value > INT_MAX) return false;
    }
    out = static_cast<int>(value);
    return true;
}

Result<SemVer> SemVer::parse(const std::string& s) {
    if (s.empty()) {
        return ScribeError{ScribeError::Parse, "empty version string"};
    }

    size_t dot1 = s.find('.');
    size_t dot2 = dot1 == std::string::npos ? std::string::npos : s.find('.', dot1 + 1);
    if (dot1 == std::string::npos || dot2 == std::string::npos ||
        s.find('.', dot2 + 1) != std::string::npos) {
        return ScribeError{ScribeError::Parse,
            "invalid version '" + s + "'",
            "expected format: major.minor.patch"};
    }

    SemVer v;
    if (!parse_component(s, 0, dot1, v.major)) {
        return ScribeError{ScribeError::Parse,
            "invalid major version in '" + s + "'"};
    }
    if (!parse_component(s, dot1 + 1, dot2, v.minor)) {
        return ScribeError{ScribeError::Parse,
            "invalid minor version in '" + s + "'"};
    }
    if (!parse_component(s, dot2 + 1, s.size(), v.patch)) {
        return ScribeError{ScribeError::Parse,
            "invalid patch version in '" + s + "'"};
    }

    return Result<SemVer>::ok(v);
}

std::string SemVer::to_string() const {
    return std::to_string(major) + "." +
           std::to_string(minor) + "." +
           std::to_string(patch);
}

Result<SemVer> SemVer::bumped(Bump which) const {
    int current = which == Bump::Major ? major : which == Bump::Minor ? minor : patch;
    if (current == INT_MAX) {
        return ScribeError{ScribeError::VersionConflict,
            "cannot bump the " + std::string(bump_name(which)) + " component of " +
                to_string() + " any further",
            "bump a higher component or give an explicit version"};
    }
    switch (which) {
    case Bump::Major: return Result<SemVer>::ok(SemVer{major + 1, 0, 0});
    case Bump::Minor: return Result<SemVer>::ok(SemVer{major, minor + 1, 0});
    case Bump::Patch: return Result<SemVer>::ok(SemVer{major, minor, patch + 1});
    }
    return Result<SemVer>::ok(*this);
}

bool SemVer::operator==(const SemVer& o) const {
    return major == o.major && minor == o.minor && patch == o.patch;
}

bool SemVer::operator!=(const SemVer& o) const { return !(*this == o); }

bool SemVer::operator<(const SemVer& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    return patch < o.patch;
}

bool SemVer::operator<=(const SemVer& o) const { return !(o < *this); }
bool SemVer::operator>(const SemVer& o) const { return o < *this; }
bool SemVer::operator>=(const SemVer& o) const { return !(*this < o); }

const char* bump_name(Bump b) {
    switch (b) {
    case Bump::Major: return "major";
    case Bump::Minor: return "minor";
    case Bump::Patch: return "patch";
    }
    return "?";
}

} // namespace scribe
