#ifndef XBRIDGE_LOG_HPP
#define XBRIDGE_LOG_HPP

#include <cstdint>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace xbridge {
namespace log {

// =============================================================================
// Level
// =============================================================================

enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

const char* level_name(Level lvl);

// Accepts trace/debug/info/warn/error/fatal/off; throws std::invalid_argument
Level parse_level(std::string_view name);

// =============================================================================
// Logger (process-wide, thread-safe)
// =============================================================================

class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(Level lvl) noexcept { level_ = lvl; }
    Level level() const noexcept { return level_; }
    bool enabled(Level lvl) const noexcept { return lvl >= level_ && lvl != Level::Off; }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Sink is std::clog unless replaced; the caller keeps `os` alive
    void set_output(std::ostream* os) noexcept;

    void log(Level lvl, const std::string& msg);

private:
    Logger();

    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    std::mutex mutex_;
};

// Collects << into a string and logs on destruction
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}
    ~LogStream() { Logger::instance().log(lvl_, ss_.str()); }

    template <typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace xbridge

// =============================================================================
// Macros
// =============================================================================

#define XB_LOG_LEVEL(lvl) \
    if (!::xbridge::log::Logger::instance().enabled((lvl))) {} \
    else ::xbridge::log::LogStream((lvl))

#define XB_TRACE(msg) XB_LOG_LEVEL(::xbridge::log::Level::Trace) << msg
#define XB_DEBUG(msg) XB_LOG_LEVEL(::xbridge::log::Level::Debug) << msg
#define XB_INFO(msg)  XB_LOG_LEVEL(::xbridge::log::Level::Info)  << msg
#define XB_WARN(msg)  XB_LOG_LEVEL(::xbridge::log::Level::Warn)  << msg
#define XB_ERROR(msg) XB_LOG_LEVEL(::xbridge::log::Level::Error) << msg
#define XB_FATAL(msg) XB_LOG_LEVEL(::xbridge::log::Level::Fatal) << msg

#endif // XBRIDGE_LOG_HPP
