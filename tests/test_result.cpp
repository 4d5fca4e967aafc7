#include <catch2/catch.hpp>
#include <scribe/result.hpp>
#include <scribe/version.hpp>
#include <memory>
#include <string>

using namespace scribe;

// Next patch version of a version string, propagating parse errors
static Result<std::string> next_patch(const std::string& current) {
    auto parsed = SemVer::parse(current);
    SCRIBE_TRY(parsed);
    auto next = parsed.value().bumped(Bump::Patch);
    SCRIBE_TRY(next);
    return Result<std::string>::ok(next.value().to_string());
}

static Status require_positive(double score) {
    if (score <= 0.0) {
        return ScribeError{ScribeError::InvalidArg, "score must be positive"};
    }
    return ok_status();
}

static Result<double> halve_positive(double score) {
    SCRIBE_TRY(require_positive(score));
    return Result<double>::ok(score / 2.0);
}

TEST_CASE("ok and err hold what they were built with", "[result]") {
    auto ok = Result<std::string>::ok("1.0.0");
    REQUIRE(ok.is_ok());
    REQUIRE(static_cast<bool>(ok));
    REQUIRE(ok.value() == "1.0.0");

    Result<std::string> err = ScribeError{ScribeError::NotFound, "no head", "create a version"};
    REQUIRE(err.is_err());
    REQUIRE_FALSE(static_cast<bool>(err));
    REQUIRE(err.error().message == "no head");
    REQUIRE(err.error().hint == "create a version");
    REQUIRE_THROWS_AS(err.value(), std::bad_variant_access);
}

TEST_CASE("is_err with a code", "[result]") {
    Result<int> conflict = ScribeError{ScribeError::VersionConflict, "head moved"};
    REQUIRE(conflict.is_err(ScribeError::VersionConflict));
    REQUIRE_FALSE(conflict.is_err(ScribeError::NotFound));
    REQUIRE_FALSE(Result<int>::ok(1).is_err(ScribeError::VersionConflict));
}

TEST_CASE("SCRIBE_TRY returns the first error", "[result]") {
    REQUIRE(next_patch("1.4.9").value() == "1.4.10");

    auto bad = next_patch("one.two");
    REQUIRE(bad.is_err(ScribeError::Parse));

    REQUIRE(halve_positive(80.0).value() == Approx(40.0));
    REQUIRE(halve_positive(0.0).is_err(ScribeError::InvalidArg));
}

TEST_CASE("map, and_then and or_else", "[result]") {
    auto ver = SemVer::parse("2.1.0");
    auto text = ver.map([](SemVer& v) { return v.to_string() + "-rc"; });
    REQUIRE(text.value() == "2.1.0-rc");

    auto chained = SemVer::parse("2.1.0").and_then([](SemVer& v) {
        return v.bumped(Bump::Major);
    });
    REQUIRE(chained.value().major == 3);

    bool called = false;
    auto skipped = SemVer::parse("x").map([&](SemVer& v) { called = true; return v.major; });
    REQUIRE(skipped.is_err(ScribeError::Parse));
    REQUIRE_FALSE(called);

    auto recovered = SemVer::parse("").or_else([](ScribeError&) {
        return Result<SemVer>::ok(SemVer::initial());
    });
    REQUIRE(recovered.value().to_string() == "1.0.0");
}

TEST_CASE("move-only values", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
    auto owned = std::move(r).value();
    REQUIRE(*owned == 99);
}

TEST_CASE("ScribeError format", "[error]") {
    ScribeError with_hint{ScribeError::VersionConflict, "head moved", "reload and retry"};
    REQUIRE(with_hint.format() == "error[VersionConflict]: head moved\n  hint: reload and retry");

    ScribeError bare{ScribeError::Checksum, "content hash mismatch"};
    REQUIRE(bare.format() == "error[Checksum]: content hash mismatch");
}

TEST_CASE("ScribeError code names", "[error]") {
    const std::pair<ScribeError::Code, const char*> names[] = {
        {ScribeError::NotFound, "NotFound"},
        {ScribeError::VersionConflict, "VersionConflict"},
        {ScribeError::ContentTooLarge, "ContentTooLarge"},
        {ScribeError::Encoding, "Encoding"},
        {ScribeError::NoScores, "NoScores"},
        {ScribeError::UnsupportedRule, "UnsupportedRule"},
        {ScribeError::InvalidArg, "InvalidArg"},
        {ScribeError::Duplicate, "Duplicate"},
        {ScribeError::Parse, "Parse"},
        {ScribeError::Config, "Config"},
        {ScribeError::IO, "IO"},
        {ScribeError::Storage, "Storage"},
        {ScribeError::Checksum, "Checksum"},
    };
    for (const auto& [code, name] : names) {
        REQUIRE(std::string(ScribeError::code_name(code)) == name);
    }
}
