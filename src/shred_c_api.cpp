#include "safeshred/shred_c_api.h"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "safeshred/shred_engine.hpp"

namespace {

constexpr const char* kDefaultLogPath = "shredder.log";

safeshred::ShredLogger& ProcessLogger() {
    static safeshred::ShredLogger logger;
    return logger;
}

safeshred::FileSystemStorage& ProcessStorage() {
    static safeshred::FileSystemStorage storage;
    return storage;
}

std::string ResolveLogPath() {
    const char* configured = std::getenv("SAFESHRED_LOG_PATH");
    if (configured != nullptr && configured[0] != '\0') {
        return configured;
    }
    return kDefaultLogPath;
}

}  // namespace

extern "C" {

void init_logger(void) {
    safeshred::ShredLogger& logger = ProcessLogger();
    if (logger.IsOpen()) {
        return;
    }
    const std::string path = ResolveLogPath();
    if (!logger.Init(path)) {
        std::cerr << "[log] cannot open log file: " << path << "\n";
        return;
    }
    logger.Info("Logger initialized: " + path);
}

void close_logger(void) {
    safeshred::ShredLogger& logger = ProcessLogger();
    if (!logger.IsOpen()) {
        return;
    }
    logger.Info("Logger closing");
    logger.Close();
}

int shred(const char* path, int passes) {
    return shred_with_progress(path, passes, nullptr, nullptr, nullptr);
}

int shred_with_progress(
    const char* path,
    int passes,
    shred_progress_fn progress,
    void* user_data,
    shred_result* out_result) {
    safeshred::ShredResult result;
    try {
        safeshred::ShredEngine engine(ProcessLogger(), ProcessStorage());
        safeshred::ProgressCallback callback;
        if (progress != nullptr) {
            callback = [progress, user_data](const int percent) { progress(percent, user_data); };
        }
        result = engine.Shred(safeshred::ShredRequest{path == nullptr ? std::string() : std::string(path), passes}, callback);
    } catch (const std::exception& ex) {
        ProcessLogger().Error(std::string("Shred aborted by exception: ") + ex.what());
        result.status = safeshred::ShredStatus::IoError;
        result.detail = ex.what();
    } catch (...) {
        ProcessLogger().Error("Shred aborted by a non-standard exception");
        result.status = safeshred::ShredStatus::IoError;
        result.detail = "unknown exception";
    }

    if (out_result != nullptr) {
        out_result->status = static_cast<int>(result.status);
        out_result->warning = static_cast<int>(result.warning);
        out_result->bytes_processed = result.bytes_processed;
        out_result->passes_completed = static_cast<uint64_t>(result.passes_completed);
    }
    return static_cast<int>(result.Outcome());
}

const char* shred_status_name(int status) {
    if (status < SHRED_OK || status > SHRED_CANCELLED) {
        return "UnknownStatus";
    }
    // ToString returns views over string literals.
    return safeshred::ToString(static_cast<safeshred::ShredStatus>(status)).data();
}

}  // extern "C"
