#include "safeshred/shred_logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>

namespace safeshred {

namespace {

std::string UtcTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buffer[32] = {};
    const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

}  // namespace

std::string_view ToString(const LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
    }
    return "LOG";
}

ShredLogger::~ShredLogger() {
    Close();
}

bool ShredLogger::Init(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) {
        return true;
    }
    if (path.empty()) {
        return false;
    }

#ifdef _WIN32
    const auto* begin = reinterpret_cast<const char8_t*>(path.data());
    out_.open(std::filesystem::path(std::u8string(begin, begin + path.size())), std::ios::out | std::ios::app);
#else
    out_.open(path, std::ios::out | std::ios::app);
#endif
    if (!out_.is_open()) {
        return false;
    }
    path_ = path;
    open_ = true;
    return true;
}

void ShredLogger::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return;
    }
    out_.flush();
    out_.close();
    open_ = false;
}

bool ShredLogger::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::string ShredLogger::Path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return path_;
}

void ShredLogger::SetMinLevel(const LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void ShredLogger::SetMirrorToStderr(const bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    mirror_stderr_ = enabled;
}

void ShredLogger::Log(const LogLevel level, const std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_ || level < min_level_) {
        return;
    }
    out_ << UtcTimestamp() << " [" << ToString(level) << "] " << message << "\n";
    if (level >= LogLevel::Warning) {
        out_.flush();
    }
    if (mirror_stderr_) {
        std::cerr << "[log] " << message << "\n";
    }
}

}  // namespace safeshred
