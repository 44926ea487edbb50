#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "safeshred/shred_status.hpp"

namespace safeshred {

struct TargetInfo {
    bool exists = false;
    bool regular_file = false;
    bool was_symlink = false;
    bool writable = false;
    bool deletable = false;
    // Symbolic links are resolved here; the engine only ever touches this path.
    std::string resolved_path;
};

// An open, exclusively held file. Writes are positional and unbuffered.
class IShredTarget {
public:
    virtual ~IShredTarget() = default;

    virtual ShredStatus Size(std::uint64_t& out_size) = 0;
    virtual ShredStatus WriteAt(std::uint64_t offset, const std::uint8_t* data, std::size_t length) = 0;
    virtual ShredStatus Sync() = 0;
    virtual ShredStatus Truncate() = 0;
    virtual ShredStatus Close() = 0;
    virtual std::string LastError() const = 0;
};

class IShredStorage {
public:
    virtual ~IShredStorage() = default;

    virtual ShredStatus Inspect(const std::string& path, TargetInfo& out_info, std::string& out_error) = 0;
    virtual std::unique_ptr<IShredTarget> OpenExclusive(
        const std::string& path,
        ShredStatus& out_status,
        std::string& out_error) = 0;
    virtual ShredStatus Rename(const std::string& from, const std::string& to, std::string& out_error) = 0;
    virtual ShredStatus Remove(const std::string& path, std::string& out_error) = 0;
};

// Local filesystem. On POSIX the target is an O_RDWR descriptor holding a
// non-blocking flock(LOCK_EX); on Windows a write-through handle opened with
// no share mode.
class FileSystemStorage final : public IShredStorage {
public:
    ShredStatus Inspect(const std::string& path, TargetInfo& out_info, std::string& out_error) override;
    std::unique_ptr<IShredTarget> OpenExclusive(
        const std::string& path,
        ShredStatus& out_status,
        std::string& out_error) override;
    ShredStatus Rename(const std::string& from, const std::string& to, std::string& out_error) override;
    ShredStatus Remove(const std::string& path, std::string& out_error) override;
};

}  // namespace safeshred
