#pragma once

#include <mutex>
#include <atomic>
#include <array>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>

namespace lcr {
namespace log {

enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

namespace detail {

struct LevelInfo {
    std::string_view cli_name;   // as accepted on the command line
    const char* tag;             // as printed in the log line
    const char* color;           // ANSI SGR sequence
};

inline constexpr std::array<LevelInfo, 6> LEVELS{{
    {"trace", "TRACE", "\033[37m"},
    {"debug", "DEBUG", "\033[36m"},
    {"info",  "INFO",  "\033[32m"},
    {"warn",  "WARN",  "\033[33m"},
    {"error", "ERROR", "\033[31m"},
    {"fatal", "FATAL", "\033[1;31m"},
}};

inline constexpr const LevelInfo& info(Level lvl) noexcept {
    return LEVELS[static_cast<std::size_t>(lvl)];
}

} // namespace detail

// Unknown names map to Info
[[nodiscard]]
inline Level parse_level(std::string_view name) noexcept {
    for (std::size_t i = 0; i < detail::LEVELS.size(); ++i) {
        if (detail::LEVELS[i].cli_name == name) {
            return static_cast<Level>(i);
        }
    }
    return Level::Info;
}

// ---------------------------------------------------------
// Process-wide logger. Level and color are lock-free; the
// sink pointer and the write itself are serialized.
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    void enable_color(bool on) noexcept { color_.store(on, std::memory_order_relaxed); }

    // stderr unless redirected; stdout belongs to the application
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const std::string line = format_(lvl, msg, color_.load(std::memory_order_relaxed));
        std::lock_guard<std::mutex> lock(mutex_);
        *out_ << line << std::endl;
    }

private:
    Logger() = default;

    // "<YYYY-mm-dd HH:MM:SS.mmm> [LEVEL] message"
    static std::string format_(Level lvl, const std::string& msg, bool color) {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const std::time_t t = system_clock::to_time_t(now);
        const int ms = static_cast<int>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
        std::tm tm{};
        localtime_r(&t, &tm);
        char stamp[32];
        const std::size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(stamp + n, sizeof(stamp) - n, ".%03d", ms);

        const auto& li = detail::info(lvl);
        std::string line;
        line.reserve(msg.size() + 48);
        if (color) line += li.color;
        line += stamp;
        line += " [";
        line += li.tag;
        line += "] ";
        line += msg;
        if (color) line += "\033[0m";
        return line;
    }

private:
    std::ostream* out_{&std::cerr};
    std::atomic<Level> level_{Level::Info};
    std::atomic<bool> color_{true};
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Collects << operands, emits on destruction
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

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


// Level is checked before any operand is formatted
#define WG_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define WG_TRACE(msg)  WG_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define WG_DEBUG(msg)  WG_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define WG_INFO(msg)   WG_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define WG_WARN(msg)   WG_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define WG_ERROR(msg)  WG_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define WG_FATAL(msg)  WG_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
