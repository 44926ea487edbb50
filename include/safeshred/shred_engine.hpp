#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "safeshred/pass_pattern.hpp"
#include "safeshred/shred_logger.hpp"
#include "safeshred/shred_status.hpp"
#include "safeshred/shred_storage.hpp"

namespace safeshred {

constexpr std::size_t kDefaultShredBufferSize = 64 * 1024;
constexpr std::size_t kDefaultRenameRounds = 3;

struct ShredRequest {
    std::string path;
    int passes = 1;
};

struct ShredOptions {
    std::size_t buffer_size = kDefaultShredBufferSize;
    PatternPolicy patterns;
    bool truncate_after = true;
    bool obfuscate_name = true;
    std::size_t rename_rounds = kDefaultRenameRounds;
};

struct ShredResult {
    ShredStatus status = ShredStatus::Ok;
    // UnlinkFailed when the content was destroyed but the entry survived.
    ShredStatus warning = ShredStatus::Ok;
    std::string detail;
    std::uint64_t bytes_processed = 0;
    std::size_t passes_completed = 0;

    bool Succeeded() const { return status == ShredStatus::Ok; }

    // Single code for callers that cannot read the warning separately.
    ShredStatus Outcome() const { return status != ShredStatus::Ok ? status : warning; }
};

// Receives integer percentages, strictly increasing, ending at 100 on success.
using ProgressCallback = std::function<void(int)>;

// Overwrites a regular file pass by pass, syncing after each pass, then
// truncates, renames and unlinks it. A failed pass leaves the file in place.
//
// Symbolic links are resolved before anything is opened: the target's
// content is shredded and unlinked, the link itself is left untouched.
class ShredEngine {
public:
    ShredEngine(ShredLogger& logger, IShredStorage& storage, ShredOptions options = {});

    ShredResult Shred(
        const ShredRequest& request,
        const ProgressCallback& progress = {},
        const std::atomic<bool>* cancel = nullptr);

    const ShredOptions& Options() const { return options_; }

private:
    ShredResult Fail(
        ShredStatus status,
        const std::string& path,
        const std::string& detail,
        std::size_t passes_completed = 0,
        std::uint64_t bytes_processed = 0);
    std::string RemoveEntry(const std::string& path, ShredStatus& out_status);

    ShredLogger& logger_;
    IShredStorage& storage_;
    ShredOptions options_;
};

}  // namespace safeshred
