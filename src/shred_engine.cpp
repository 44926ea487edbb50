#include "safeshred/shred_engine.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "osrng.h"

namespace safeshred {

namespace {

// Keeps the trailing separator so a new file name can be appended directly.
std::string DirectoryPrefix(const std::string& path) {
#ifdef _WIN32
    const std::size_t slash = path.find_last_of("/\\");
#else
    const std::size_t slash = path.find_last_of('/');
#endif
    if (slash == std::string::npos) {
        return std::string();
    }
    return path.substr(0, slash + 1);
}

}  // namespace

ShredEngine::ShredEngine(ShredLogger& logger, IShredStorage& storage, ShredOptions options)
    : logger_(logger), storage_(storage), options_(std::move(options)) {}

ShredResult ShredEngine::Shred(
    const ShredRequest& request,
    const ProgressCallback& progress,
    const std::atomic<bool>* cancel) {
    if (!logger_.IsOpen()) {
        ShredResult result;
        result.status = ShredStatus::NotInitialized;
        result.detail = "logger is not initialized";
        return result;
    }

    const std::string& path = request.path;
    if (request.passes < 1) {
        return Fail(ShredStatus::InvalidArgument, path, "passes must be at least 1");
    }
    if (options_.buffer_size == 0) {
        return Fail(ShredStatus::InvalidArgument, path, "buffer size must be positive");
    }

    TargetInfo info;
    std::string error;
    const ShredStatus inspect_status = storage_.Inspect(path, info, error);
    if (inspect_status != ShredStatus::Ok) {
        return Fail(inspect_status, path, error);
    }
    if (!info.exists) {
        return Fail(ShredStatus::InvalidArgument, path, error.empty() ? "file does not exist" : error);
    }
    if (!info.regular_file) {
        return Fail(ShredStatus::InvalidArgument, path, "not a regular file");
    }
    if (!info.writable) {
        return Fail(ShredStatus::AccessDenied, path, "file is read-only");
    }
    if (!info.deletable) {
        return Fail(ShredStatus::AccessDenied, path, "containing directory does not permit deletion");
    }
    if (info.was_symlink) {
        logger_.Info(
            "Resolved symbolic link " + path + " -> " + info.resolved_path +
            "; shredding the target, the link is left in place");
    }

    const std::string& target_path = info.resolved_path;
    ShredStatus open_status = ShredStatus::Ok;
    std::unique_ptr<IShredTarget> target = storage_.OpenExclusive(target_path, open_status, error);
    if (target == nullptr) {
        return Fail(open_status == ShredStatus::Ok ? ShredStatus::IoError : open_status, path, error);
    }

    std::uint64_t size = 0;
    if (target->Size(size) != ShredStatus::Ok) {
        return Fail(ShredStatus::IoError, path, "cannot determine size: " + target->LastError());
    }

    const std::size_t passes = static_cast<std::size_t>(request.passes);
    logger_.Info(
        "Shredding " + target_path + " (" + std::to_string(size) + " bytes, " +
        std::to_string(passes) + " passes)");

    int last_percent = 0;
    auto report = [&](const std::size_t done) {
        const int percent = static_cast<int>((done * 100U) / passes);
        if (percent <= last_percent) {
            return;
        }
        last_percent = percent;
        if (progress) {
            progress(percent);
        }
    };

    const std::size_t buffer_size =
        static_cast<std::size_t>(std::min<std::uint64_t>(options_.buffer_size, size));
    std::vector<std::uint8_t> buffer(buffer_size, 0U);
    CryptoPP::AutoSeededRandomPool rng;

    auto fail_and_wipe = [&](const ShredStatus status, const std::string& detail, const std::size_t completed) {
        WipeBuffer(buffer);
        return Fail(status, path, detail, completed, size * completed);
    };

    if (cancel != nullptr && cancel->load()) {
        return fail_and_wipe(ShredStatus::Cancelled, "cancelled before the first pass", 0);
    }

    if (size == 0) {
        logger_.Info("Empty file, no content to overwrite: " + target_path);
        report(passes);
    }

    for (std::size_t pass = 1; size > 0 && pass <= passes; ++pass) {
        if (cancel != nullptr && cancel->load()) {
            return fail_and_wipe(
                ShredStatus::Cancelled,
                "cancelled before pass " + std::to_string(pass),
                pass - 1);
        }

        const PassPattern pattern = options_.patterns.PatternFor(pass, passes);
        if (pattern.kind == PatternKind::Fixed) {
            FillPattern(pattern, buffer.data(), buffer.size(), rng);
        }

        std::uint64_t offset = 0;
        while (offset < size) {
            const std::size_t chunk = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), size - offset));
            if (pattern.kind == PatternKind::Random) {
                FillPattern(pattern, buffer.data(), chunk, rng);
            }
            if (target->WriteAt(offset, buffer.data(), chunk) != ShredStatus::Ok) {
                return fail_and_wipe(
                    ShredStatus::IoError,
                    "pass " + std::to_string(pass) + " write at offset " + std::to_string(offset) +
                        " failed: " + target->LastError(),
                    pass - 1);
            }
            offset += chunk;
        }

        if (target->Sync() != ShredStatus::Ok) {
            return fail_and_wipe(
                ShredStatus::IoError,
                "pass " + std::to_string(pass) + " flush failed: " + target->LastError(),
                pass - 1);
        }

        logger_.Debug(
            "Pass " + std::to_string(pass) + "/" + std::to_string(passes) + " (" + Describe(pattern) +
            ") complete");
        report(pass);
    }
    WipeBuffer(buffer);

    if (options_.truncate_after && size > 0) {
        if (target->Truncate() != ShredStatus::Ok || target->Sync() != ShredStatus::Ok) {
            return Fail(
                ShredStatus::IoError,
                path,
                "truncate failed: " + target->LastError(),
                passes,
                size * passes);
        }
    }
    if (target->Close() != ShredStatus::Ok) {
        return Fail(ShredStatus::IoError, path, "close failed: " + target->LastError(), passes, size * passes);
    }
    target.reset();

    ShredResult result;
    result.status = ShredStatus::Ok;
    result.bytes_processed = size * passes;
    result.passes_completed = passes;

    ShredStatus unlink_status = ShredStatus::Ok;
    const std::string unlink_error = RemoveEntry(target_path, unlink_status);
    if (unlink_status != ShredStatus::Ok) {
        result.warning = ShredStatus::UnlinkFailed;
        result.detail = "content destroyed but the entry could not be removed: " + unlink_error;
        logger_.Warning("Shredded " + path + " but unlink failed: " + unlink_error);
        return result;
    }

    logger_.Info(
        "Shredded " + path + ": " + std::to_string(result.bytes_processed) + " bytes over " +
        std::to_string(passes) + " passes");
    return result;
}

ShredResult ShredEngine::Fail(
    const ShredStatus status,
    const std::string& path,
    const std::string& detail,
    const std::size_t passes_completed,
    const std::uint64_t bytes_processed) {
    std::string message = "Shred failed for " + path + ": " + std::string(ToString(status));
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    message += ", passes completed: " + std::to_string(passes_completed);
    logger_.Error(message);

    ShredResult result;
    result.status = status;
    result.detail = detail;
    result.passes_completed = passes_completed;
    result.bytes_processed = bytes_processed;
    return result;
}

std::string ShredEngine::RemoveEntry(const std::string& path, ShredStatus& out_status) {
    std::string current = path;
    std::string error;

    if (options_.obfuscate_name) {
        const std::string prefix = DirectoryPrefix(path);
        CryptoPP::AutoSeededRandomPool rng;
        for (std::size_t round = 0; round < options_.rename_rounds; ++round) {
            const std::string renamed = prefix + RandomEntryName(16, rng);
            if (storage_.Rename(current, renamed, error) != ShredStatus::Ok) {
                logger_.Warning("Rename of " + current + " failed, unlinking under current name: " + error);
                break;
            }
            current = renamed;
        }
    }

    out_status = storage_.Remove(current, error);
    if (out_status != ShredStatus::Ok) {
        return current + ": " + error;
    }
    return std::string();
}

}  // namespace safeshred
