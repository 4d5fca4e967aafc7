#pragma once

#include <string>

namespace scribe {

struct ScribeError {
    enum Code {
        NotFound,
        VersionConflict,
        ContentTooLarge,
        Encoding,
        NoScores,
        UnsupportedRule,
        InvalidArg,
        Duplicate,
        Parse,
        Config,
        IO,
        Storage,
        Checksum
    };

    Code code;
    std::string message;
    std::string hint;

    ScribeError() = default;
    ScribeError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ScribeError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace scribe
