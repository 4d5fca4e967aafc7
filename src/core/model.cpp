#include <scribe/core/model.hpp>
#include <chrono>

namespace scribe {

const char* artifact_status_name(ArtifactStatus s) {
    switch (s) {
    case ArtifactStatus::Draft:    return "draft";
    case ArtifactStatus::Review:   return "review";
    case ArtifactStatus::Staged:   return "staged";
    case ArtifactStatus::Deployed: return "deployed";
    case ArtifactStatus::Archived: return "archived";
    }
    return "unknown";
}

Result<ArtifactStatus> parse_artifact_status(const std::string& s) {
    if (s == "draft")    return Result<ArtifactStatus>::ok(ArtifactStatus::Draft);
    if (s == "review")   return Result<ArtifactStatus>::ok(ArtifactStatus::Review);
    if (s == "staged")   return Result<ArtifactStatus>::ok(ArtifactStatus::Staged);
    if (s == "deployed") return Result<ArtifactStatus>::ok(ArtifactStatus::Deployed);
    if (s == "archived") return Result<ArtifactStatus>::ok(ArtifactStatus::Archived);
    return ScribeError{ScribeError::Parse,
        "unknown artifact status '" + s + "'",
        "expected one of: draft, review, staged, deployed, archived"};
}

int64_t now_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace scribe
