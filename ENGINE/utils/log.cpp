#include "log.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string_view>

namespace charsheet::log {

namespace {

struct LoggerState {
    std::mutex mutex;
    std::once_flag env_once;
    Level level = Level::Info;
    std::unique_ptr<std::ofstream> file;
    std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

Level parse_level(std::string_view value) {
    std::string lower(value);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "debug") return Level::Debug;
    return Level::Info;
}

bool truthy(const char* value) {
    if (!value) {
        return false;
    }
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(*value)));
    return c == '1' || c == 'y' || c == 't';
}

void configure_from_env(LoggerState& s) {
    if (const char* v = std::getenv("CHARSHEET_LOG_LEVEL")) {
        s.level = parse_level(v);
    }
    const char* path = std::getenv("CHARSHEET_LOG_FILE");
    if (!path || !*path) {
        return;
    }
    const auto mode = std::ios::out | (truthy(std::getenv("CHARSHEET_LOG_APPEND")) ? std::ios::app : std::ios::trunc);
    auto sink = std::make_unique<std::ofstream>(path, mode);
    if (sink->good()) {
        s.file = std::move(sink);
    } else {
        std::cerr << "[WARN] could not open log file '" << path << "'\n";
    }
}

LoggerState& ready_state() {
    LoggerState& s = state();
    std::call_once(s.env_once, [&s]() { configure_from_env(s); });
    return s;
}

const char* tag(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
    }
    return "INFO";
}

void write_line(Level level, const std::string& message) {
    LoggerState& s = ready_state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (static_cast<int>(level) > static_cast<int>(s.level)) {
        return;
    }
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - s.origin).count();
    std::ostringstream line;
    line << '[' << tag(level) << "] +" << std::fixed << std::setprecision(3) << elapsed << "s: " << message << '\n';

    std::ostream& out = level == Level::Error ? std::cerr : std::cout;
    out << line.str() << std::flush;
    if (s.file) {
        *s.file << line.str() << std::flush;
    }
}

}

void set_level(Level level) {
    LoggerState& s = ready_state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
}

Level level() {
    LoggerState& s = ready_state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.level;
}

void reset_time_origin() {
    LoggerState& s = ready_state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.origin = std::chrono::steady_clock::now();
}

void error(const std::string& message) { write_line(Level::Error, message); }
void warn (const std::string& message) { write_line(Level::Warn,  message); }
void info (const std::string& message) { write_line(Level::Info,  message); }
void debug(const std::string& message) { write_line(Level::Debug, message); }

}
