#pragma once

#include <string>

namespace charsheet::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// CHARSHEET_LOG_LEVEL, CHARSHEET_LOG_FILE and CHARSHEET_LOG_APPEND are read on first use.
void set_level(Level level);
Level level();

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

// Restores the previous level on destruction.
class ScopedLevel {
public:
    explicit ScopedLevel(Level next) : previous_(level()) { set_level(next); }
    ~ScopedLevel() { set_level(previous_); }
    ScopedLevel(const ScopedLevel&) = delete;
    ScopedLevel& operator=(const ScopedLevel&) = delete;

private:
    Level previous_;
};

}
