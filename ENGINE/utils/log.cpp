#include "utils/log.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace tessera::log {

namespace {

struct Logger {
    std::mutex                     mutex;
    Level                          level = Level::Info;
    std::unique_ptr<std::ofstream> file;
    std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
};

Logger& logger() {
    static Logger instance;
    return instance;
}

bool env_flag_set(const char* value) {
    return value && (*value == '1' || *value == 'y' || *value == 'Y' || *value == 't' || *value == 'T');
}

std::unique_ptr<std::ofstream> open_stream(const std::string& path, bool append) {
    auto out = std::make_unique<std::ofstream>(path, std::ios::out | (append ? std::ios::app : std::ios::trunc));
    if (!out->good()) {
        return nullptr;
    }
    return out;
}

Logger& configured() {
    static std::once_flag env_once;
    Logger& l = logger();
    std::call_once(env_once, [&l]() {
        if (const char* v = std::getenv("TESSERA_LOG_LEVEL")) {
            l.level = parse_level(v);
        }
        const char* file = std::getenv("TESSERA_LOG_FILE");
        if (file && *file) {
            l.file = open_stream(file, env_flag_set(std::getenv("TESSERA_LOG_APPEND")));
            if (!l.file) {
                std::cerr << "[WARN] could not open log file '" << file << "'\n";
            }
        }
    });
    return l;
}

void write(Level level, const std::string& message) {
    Logger& l = configured();
    std::lock_guard<std::mutex> lock(l.mutex);
    if (static_cast<int>(level) > static_cast<int>(l.level)) {
        return;
    }
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - l.origin).count();
    const std::string line = format_line(level, secs, message) + '\n';

    std::ostream& os = (level == Level::Error) ? std::cerr : std::cout;
    os << line;
    os.flush();
    if (l.file) {
        *l.file << line;
        l.file->flush();
    }
}

}

void set_level(Level level) {
    Logger& l = configured();
    std::lock_guard<std::mutex> lock(l.mutex);
    l.level = level;
}

Level level() {
    Logger& l = configured();
    std::lock_guard<std::mutex> lock(l.mutex);
    return l.level;
}

Level parse_level(const std::string& text, Level fallback) {
    std::string lower = text;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return fallback;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default:           return "INFO";
    }
}

bool open_file(const std::string& path, bool append) {
    auto out = open_stream(path, append);
    if (!out) {
        return false;
    }
    Logger& l = configured();
    std::lock_guard<std::mutex> lock(l.mutex);
    l.file = std::move(out);
    return true;
}

void close_file() {
    Logger& l = configured();
    std::lock_guard<std::mutex> lock(l.mutex);
    l.file.reset();
}

std::string format_line(Level level, double seconds, const std::string& message) {
    std::ostringstream ss;
    ss << '[' << level_name(level) << "] +" << std::fixed << std::setprecision(3) << seconds << "s: " << message;
    return ss.str();
}

void reset_time_origin() {
    Logger& l = configured();
    std::lock_guard<std::mutex> lock(l.mutex);
    l.origin = std::chrono::steady_clock::now();
}

void error(const std::string& message) { write(Level::Error, message); }
void warn (const std::string& message) { write(Level::Warn,  message); }
void info (const std::string& message) { write(Level::Info,  message); }
void debug(const std::string& message) { write(Level::Debug, message); }

}
