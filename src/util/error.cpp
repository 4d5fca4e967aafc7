#include <scribe/error.hpp>

namespace scribe {

const char* ScribeError::code_name(Code c) {
    switch (c) {
        case NotFound:        return "NotFound";
        case VersionConflict: return "VersionConflict";
        case ContentTooLarge: return "ContentTooLarge";
        case Encoding:        return "Encoding";
        case NoScores:        return "NoScores";
        case UnsupportedRule: return "UnsupportedRule";
        case InvalidArg:      return "InvalidArg";
        case Duplicate:       return "Duplicate";
        case Parse:           return "Parse";
        case Config:          return "Config";
        case IO:              return "IO";
        case Storage:         return "Storage";
        case Checksum:        return "Checksum";
    }
    return "Unknown";
}

std::string ScribeError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace scribe
