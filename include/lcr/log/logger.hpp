#pragma once

#include <mutex>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <optional>

#include <unistd.h>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Fatal: return "fatal";
        case Level::Off:   return "off";
    }
    return "unknown";
}

// Accepts the lowercase names produced by to_string(Level)
[[nodiscard]]
inline std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info")  return Level::Info;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    if (name == "off")   return Level::Off;
    return std::nullopt;
}

// Environment variable read by Logger::configure_from_env()
inline constexpr const char* LOG_LEVEL_ENV = "SPINDLE_LOG_LEVEL";

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    Level level() const noexcept { return level_; }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        return lvl >= level_ && level_ != Level::Off;
    }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter (stderr by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
        color_enabled_ = false; // custom sinks are rarely terminals
    }

    // Applies SPINDLE_LOG_LEVEL when set to a known level name.
    // Returns false if the variable holds an unknown value (level unchanged).
    bool configure_from_env() noexcept {
        const char* raw = std::getenv(LOG_LEVEL_ENV);
        if (raw == nullptr) {
            return true;
        }
        if (auto lvl = parse_level(raw)) {
            level_ = *lvl;
            return true;
        }
        return false;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << '\n' << std::flush;
    }

private:
    Logger()
        : out_(&std::cerr)
        , level_(Level::Info)
        , color_enabled_(::isatty(STDERR_FILENO) != 0)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            case Level::Off:   break;
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            case Level::Off:   break;
        }
        return "\033[0m";
    }

    // Local time with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
// The level check happens before the message is formatted.
#define SP_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define SP_TRACE(msg)  SP_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define SP_DEBUG(msg)  SP_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define SP_INFO(msg)   SP_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define SP_WARN(msg)   SP_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define SP_ERROR(msg)  SP_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define SP_FATAL(msg)  SP_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
