#pragma once

#include <string>

namespace tessera::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// The first call into this namespace reads TESSERA_LOG_LEVEL,
// TESSERA_LOG_FILE and TESSERA_LOG_APPEND. Later calls override them.
void set_level(Level level);
Level level();

Level parse_level(const std::string& text, Level fallback = Level::Info);
const char* level_name(Level level);

// Mirrors every emitted line into `path`. On failure the previous file sink
// is kept and false is returned.
bool open_file(const std::string& path, bool append);
void close_file();

// "[WARN] +1.234s: message", no trailing newline.
std::string format_line(Level level, double seconds, const std::string& message);

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

}
