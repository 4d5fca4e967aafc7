#include <scribe/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <ctime>
#include <mutex>
#include <unistd.h>

namespace scribe::log {

namespace {

// The level is atomic. Everything else is read and written under the mutex.
struct Sink {
    std::mutex mutex;
    std::FILE* out = nullptr;     // nullptr means stderr
    std::atomic<Level> level{Info};
    int color = -1;               // -1 until decided from isatty
    bool timestamps = false;

    std::FILE* stream() const { return out ? out : stderr; }

    bool color_locked() {
        if (color < 0) color = isatty(fileno(stream())) ? 1 : 0;
        return color == 1;
    }
};

Sink& sink() {
    static Sink s;
    return s;
}

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

void write_timestamp(std::FILE* f) {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t secs = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&secs, &local);
    std::fprintf(f, "%02d:%02d:%02d.%03d ", local.tm_hour, local.tm_min, local.tm_sec,
                 static_cast<int>(ms));
}

void vlog(Level lvl, const char* fmt, va_list args) {
    Sink& s = sink();
    if (lvl < s.level.load()) return;

    std::lock_guard<std::mutex> lock(s.mutex);
    bool color = s.color_locked();
    std::FILE* f = s.stream();
    if (s.timestamps) write_timestamp(f);
    if (color) {
        std::fprintf(f, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(f, "%s: ", level_name(lvl));
    }
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

} // namespace

void set_level(Level lvl) {
    sink().level.store(lvl);
}

Level get_level() {
    return sink().level.load();
}

void set_output(std::FILE* out) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.out = out;
    s.color = -1;
}

void set_color_enabled(bool enabled) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.color = enabled ? 1 : 0;
}

bool is_color_enabled() {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.color_locked();
}

void set_timestamps_enabled(bool enabled) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.timestamps = enabled;
}

bool is_timestamps_enabled() {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.timestamps;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    if (lower == "warning") return Result<Level>::ok(Warn);

    return ScribeError{ScribeError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Error, fmt, args);
    va_end(args);
}

} // namespace scribe::log
