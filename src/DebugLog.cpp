#include "DebugLog.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

std::string timestamp() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    auto t = system_clock::to_time_t(tp);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    std::tm tmv;
    localtime_r(&t, &tmv);
    std::ostringstream oss;
    oss << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

const char* levelName(DebugLog::Level lvl) {
    switch (lvl) {
        case DebugLog::Level::Debug: return "DEBUG";
        case DebugLog::Level::Info:  return "INFO";
        case DebugLog::Level::Warn:  return "WARN";
        case DebugLog::Level::Error: return "ERROR";
        default:                     return "NONE";
    }
}

} // namespace

DebugLog::DebugLog(const std::string& filename, Level level)
    : filename(filename), currentLevel(level) {
    out.open(filename, std::ios::out | std::ios::app);
    if (out.is_open()) {
        out << "===== session start " << timestamp() << " =====\n";
        out.flush();
    }
}

DebugLog::~DebugLog() {
    std::lock_guard<std::mutex> lock(mtx);
    if (out.is_open()) {
        out << "===== session end   " << timestamp() << " =====" << std::endl;
    }
}

bool DebugLog::isOpen() const {
    std::lock_guard<std::mutex> lock(mtx);
    return out.is_open();
}

void DebugLog::setLevel(Level lvl) {
    std::lock_guard<std::mutex> lock(mtx);
    currentLevel = lvl;
}

DebugLog::Level DebugLog::level() const {
    std::lock_guard<std::mutex> lock(mtx);
    return currentLevel;
}

bool DebugLog::enabled(Level lvl) const {
    std::lock_guard<std::mutex> lock(mtx);
    return lvl != Level::None && out.is_open() && lvl >= currentLevel;
}

void DebugLog::debug(const std::string& msg) { write(Level::Debug, msg); }
void DebugLog::info(const std::string& msg) { write(Level::Info, msg); }
void DebugLog::warn(const std::string& msg) { write(Level::Warn, msg); }
void DebugLog::error(const std::string& msg) { write(Level::Error, msg); }

void DebugLog::write(Level lvl, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!out.is_open() || lvl < currentLevel) return;
    out << timestamp() << " [" << levelName(lvl) << "] " << msg << '\n';
    if (lvl >= Level::Warn) out.flush();
}

DebugLog::Level DebugLog::parseLevel(const std::string& name, Level fallback) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return Level::Debug;
    if (v == "info") return Level::Info;
    if (v == "warn" || v == "warning") return Level::Warn;
    if (v == "error") return Level::Error;
    if (v == "none" || v == "off") return Level::None;
    return fallback;
}
