#pragma once
#include <fstream>
#include <mutex>
#include <string>

// Timestamped append-only log file. The world never owns one; callers
// attach an instance with World::setDebugLog.
class DebugLog {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    explicit DebugLog(const std::string& filename, Level level = Level::Info);
    ~DebugLog();

    DebugLog(const DebugLog&) = delete;
    DebugLog& operator=(const DebugLog&) = delete;

    bool isOpen() const;
    const std::string& path() const { return filename; }

    void setLevel(Level lvl);
    Level level() const;
    bool enabled(Level lvl) const;

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // Accepts debug, info, warn/warning, error, none/off (any case).
    // Unknown names yield 'fallback'.
    static Level parseLevel(const std::string& name, Level fallback = Level::Info);

private:
    void write(Level lvl, const std::string& msg);

    std::string filename;
    std::ofstream out;
    Level currentLevel;
    mutable std::mutex mtx;
};
