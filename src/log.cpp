// =============================================================================
// log.cpp - Process Logger
// =============================================================================

#include "xbridge/log.hpp"
#include <chrono>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace xbridge {
namespace log {

namespace {

const char* color_code(Level lvl) {
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

std::string timestamp() {
    using namespace std::chrono;
    auto t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
        case Level::Off:   return "OFF";
    }
    return "?????";
}

Level parse_level(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    if (name == "off") return Level::Off;
    throw std::invalid_argument("unknown log level: " + std::string(name));
}

// =============================================================================
// Logger
// =============================================================================

Logger::Logger()
    : out_(&std::clog)
    , level_(Level::Warn)
    , color_enabled_(false) {}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::set_output(std::ostream* os) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = os;
}

void Logger::log(Level lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_ == nullptr) return;
    auto& os = *out_;
    if (color_enabled_) os << color_code(lvl);
    os << timestamp() << " [" << level_name(lvl) << "] " << msg;
    if (color_enabled_) os << "\033[0m";
    os << '\n';
}

} // namespace log
} // namespace xbridge
