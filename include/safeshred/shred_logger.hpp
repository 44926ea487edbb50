#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace safeshred {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

std::string_view ToString(LogLevel level);

// Log sink handed to the engine. Init and Close may be called any number of
// times; only the first Init after a Close opens a destination.
class ShredLogger {
public:
    ShredLogger() = default;
    ~ShredLogger();

    ShredLogger(const ShredLogger&) = delete;
    ShredLogger& operator=(const ShredLogger&) = delete;

    bool Init(const std::string& path);
    void Close();
    bool IsOpen() const;

    void SetMinLevel(LogLevel level);
    void SetMirrorToStderr(bool enabled);

    void Log(LogLevel level, std::string_view message);
    void Debug(std::string_view message) { Log(LogLevel::Debug, message); }
    void Info(std::string_view message) { Log(LogLevel::Info, message); }
    void Warning(std::string_view message) { Log(LogLevel::Warning, message); }
    void Error(std::string_view message) { Log(LogLevel::Error, message); }

    std::string Path() const;

private:
    mutable std::mutex mutex_;
    std::ofstream out_;
    std::string path_;
    bool open_ = false;
    bool mirror_stderr_ = false;
    LogLevel min_level_ = LogLevel::Info;
};

}  // namespace safeshred
