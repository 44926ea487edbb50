#include "safeshred/shred_storage.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace safeshred {

namespace {

std::filesystem::path PathFromUtf8(const std::string& value) {
#ifdef _WIN32
    const auto* begin = reinterpret_cast<const char8_t*>(value.data());
    const auto* end = begin + value.size();
    return std::filesystem::path(std::u8string(begin, end));
#else
    return std::filesystem::path(value);
#endif
}

std::string Utf8FromPath(const std::filesystem::path& value) {
#ifdef _WIN32
    const std::u8string utf8 = value.u8string();
    return std::string(reinterpret_cast<const char*>(utf8.data()), utf8.size());
#else
    return value.string();
#endif
}

bool HasWriteBit(const std::filesystem::perms value) {
    using std::filesystem::perms;
    return (value & (perms::owner_write | perms::group_write | perms::others_write)) != perms::none;
}

// Missing entries are reported through TargetInfo::exists; every other
// lookup failure becomes a status.
ShredStatus LookupStatus(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ShredStatus::Ok;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ShredStatus::AccessDenied;
    }
    if (ec == std::errc::too_many_symbolic_link_levels || ec == std::errc::filename_too_long) {
        return ShredStatus::InvalidArgument;
    }
    return ShredStatus::IoError;
}

#ifdef _WIN32

std::string Win32ErrorText(const DWORD code) {
    return std::system_category().message(static_cast<int>(code));
}

class WindowsFileTarget final : public IShredTarget {
public:
    explicit WindowsFileTarget(HANDLE handle) : handle_(handle) {}

    ~WindowsFileTarget() override {
        if (handle_ != INVALID_HANDLE_VALUE) {
            CloseHandle(handle_);
        }
    }

    WindowsFileTarget(const WindowsFileTarget&) = delete;
    WindowsFileTarget& operator=(const WindowsFileTarget&) = delete;

    ShredStatus Size(std::uint64_t& out_size) override {
        LARGE_INTEGER size{};
        if (!GetFileSizeEx(handle_, &size)) {
            return Fail(GetLastError());
        }
        out_size = static_cast<std::uint64_t>(size.QuadPart);
        return ShredStatus::Ok;
    }

    ShredStatus WriteAt(std::uint64_t offset, const std::uint8_t* data, std::size_t length) override {
        LARGE_INTEGER position{};
        position.QuadPart = static_cast<LONGLONG>(offset);
        if (!SetFilePointerEx(handle_, position, nullptr, FILE_BEGIN)) {
            return Fail(GetLastError());
        }
        while (length > 0) {
            const DWORD chunk = length > 0x40000000U ? 0x40000000U : static_cast<DWORD>(length);
            DWORD written = 0;
            if (!WriteFile(handle_, data, chunk, &written, nullptr)) {
                return Fail(GetLastError());
            }
            if (written == 0) {
                last_error_ = "short write";
                return ShredStatus::IoError;
            }
            data += written;
            length -= written;
        }
        return ShredStatus::Ok;
    }

    ShredStatus Sync() override {
        if (!FlushFileBuffers(handle_)) {
            return Fail(GetLastError());
        }
        return ShredStatus::Ok;
    }

    ShredStatus Truncate() override {
        LARGE_INTEGER zero{};
        if (!SetFilePointerEx(handle_, zero, nullptr, FILE_BEGIN) || !SetEndOfFile(handle_)) {
            return Fail(GetLastError());
        }
        return ShredStatus::Ok;
    }

    ShredStatus Close() override {
        if (handle_ == INVALID_HANDLE_VALUE) {
            return ShredStatus::Ok;
        }
        const BOOL closed = CloseHandle(handle_);
        handle_ = INVALID_HANDLE_VALUE;
        if (!closed) {
            return Fail(GetLastError());
        }
        return ShredStatus::Ok;
    }

    std::string LastError() const override {
        return last_error_;
    }

private:
    ShredStatus Fail(const DWORD code) {
        last_error_ = Win32ErrorText(code);
        return ShredStatus::IoError;
    }

    HANDLE handle_;
    std::string last_error_;
};

#else

class PosixFileTarget final : public IShredTarget {
public:
    explicit PosixFileTarget(const int fd) : fd_(fd) {}

    ~PosixFileTarget() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    PosixFileTarget(const PosixFileTarget&) = delete;
    PosixFileTarget& operator=(const PosixFileTarget&) = delete;

    ShredStatus Size(std::uint64_t& out_size) override {
        struct stat st {};
        if (::fstat(fd_, &st) != 0) {
            return FailErrno();
        }
        out_size = static_cast<std::uint64_t>(st.st_size);
        return ShredStatus::Ok;
    }

    ShredStatus WriteAt(std::uint64_t offset, const std::uint8_t* data, std::size_t length) override {
        while (length > 0) {
            const ssize_t written = ::pwrite(fd_, data, length, static_cast<off_t>(offset));
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return FailErrno();
            }
            if (written == 0) {
                last_error_ = "short write";
                return ShredStatus::IoError;
            }
            data += written;
            offset += static_cast<std::uint64_t>(written);
            length -= static_cast<std::size_t>(written);
        }
        return ShredStatus::Ok;
    }

    ShredStatus Sync() override {
        if (::fsync(fd_) != 0) {
            return FailErrno();
        }
        return ShredStatus::Ok;
    }

    ShredStatus Truncate() override {
        if (::ftruncate(fd_, 0) != 0) {
            return FailErrno();
        }
        return ShredStatus::Ok;
    }

    ShredStatus Close() override {
        if (fd_ < 0) {
            return ShredStatus::Ok;
        }
        const int rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0) {
            return FailErrno();
        }
        return ShredStatus::Ok;
    }

    std::string LastError() const override {
        return last_error_;
    }

private:
    ShredStatus FailErrno() {
        last_error_ = std::strerror(errno);
        return ShredStatus::IoError;
    }

    int fd_;
    std::string last_error_;
};

#endif

}  // namespace

ShredStatus FileSystemStorage::Inspect(const std::string& path, TargetInfo& out_info, std::string& out_error) {
    out_info = TargetInfo{};
    if (path.empty()) {
        out_error = "empty path";
        return ShredStatus::InvalidArgument;
    }

    std::filesystem::path target = PathFromUtf8(path);
    std::error_code ec;
    const auto link_status = std::filesystem::symlink_status(target, ec);
    if (ec) {
        out_error = ec.message();
        return LookupStatus(ec);
    }
    if (!std::filesystem::exists(link_status)) {
        out_error = "no such file";
        return ShredStatus::Ok;
    }

    if (std::filesystem::is_symlink(link_status)) {
        out_info.was_symlink = true;
        target = std::filesystem::canonical(target, ec);
        if (ec) {
            // A dangling link has nothing to shred.
            out_error = ec.message();
            return LookupStatus(ec);
        }
    }

    const auto status = std::filesystem::status(target, ec);
    if (ec) {
        out_error = ec.message();
        return LookupStatus(ec);
    }
    if (!std::filesystem::exists(status)) {
        out_error = "no such file";
        return ShredStatus::Ok;
    }
    out_info.exists = true;
    out_info.regular_file = std::filesystem::is_regular_file(status);
    out_info.resolved_path = Utf8FromPath(target);

#ifdef _WIN32
    out_info.writable = HasWriteBit(status.permissions());
    out_info.deletable = out_info.writable;
#else
    std::filesystem::path parent = target.parent_path();
    if (parent.empty()) {
        parent = std::filesystem::path(".");
    }
    // access() alone grants root write access to read-only files; mode bits decide.
    out_info.writable = HasWriteBit(status.permissions()) && ::access(target.c_str(), W_OK) == 0;
    out_info.deletable = ::access(parent.c_str(), W_OK | X_OK) == 0;
#endif
    return ShredStatus::Ok;
}

std::unique_ptr<IShredTarget> FileSystemStorage::OpenExclusive(
    const std::string& path,
    ShredStatus& out_status,
    std::string& out_error) {
#ifdef _WIN32
    const std::filesystem::path target = PathFromUtf8(path);
    HANDLE handle = CreateFileW(
        target.c_str(),
        GENERIC_READ | GENERIC_WRITE,
        0,
        nullptr,
        OPEN_EXISTING,
        FILE_ATTRIBUTE_NORMAL | FILE_FLAG_WRITE_THROUGH,
        nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        const DWORD code = GetLastError();
        out_error = Win32ErrorText(code);
        switch (code) {
            case ERROR_ACCESS_DENIED:
            case ERROR_SHARING_VIOLATION:
            case ERROR_LOCK_VIOLATION:
            case ERROR_WRITE_PROTECT:
                out_status = ShredStatus::AccessDenied;
                break;
            case ERROR_FILE_NOT_FOUND:
            case ERROR_PATH_NOT_FOUND:
                out_status = ShredStatus::InvalidArgument;
                break;
            default:
                out_status = ShredStatus::IoError;
                break;
        }
        return nullptr;
    }
    out_status = ShredStatus::Ok;
    return std::make_unique<WindowsFileTarget>(handle);
#else
    const int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) {
        const int err = errno;
        out_error = std::strerror(err);
        switch (err) {
            case EACCES:
            case EPERM:
            case EROFS:
            case ETXTBSY:
                out_status = ShredStatus::AccessDenied;
                break;
            case ENOENT:
            case ENOTDIR:
            case ELOOP:
            case EISDIR:
                out_status = ShredStatus::InvalidArgument;
                break;
            default:
                out_status = ShredStatus::IoError;
                break;
        }
        return nullptr;
    }

    auto target = std::make_unique<PosixFileTarget>(fd);

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        out_error = std::strerror(errno);
        out_status = ShredStatus::IoError;
        return nullptr;
    }
    if (!S_ISREG(st.st_mode)) {
        out_error = "not a regular file";
        out_status = ShredStatus::InvalidArgument;
        return nullptr;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        out_error = err == EWOULDBLOCK ? "file is locked by another holder" : std::strerror(err);
        out_status = ShredStatus::AccessDenied;
        return nullptr;
    }

#ifdef __linux__
    // flock only sees cooperating holders. A write lease is refused with
    // EAGAIN while any other descriptor has the file open, locked or not.
    // Released at once: a held lease delivers SIGIO to us when it is broken.
    if (::fcntl(fd, F_SETLEASE, F_WRLCK) != 0) {
        const int err = errno;
        if (err == EAGAIN) {
            out_error = "file is open in another process";
            out_status = ShredStatus::AccessDenied;
            return nullptr;
        }
        // EACCES: not the owner. EINVAL: the filesystem has no leases.
        if (err != EACCES && err != EINVAL) {
            out_error = std::strerror(err);
            out_status = ShredStatus::IoError;
            return nullptr;
        }
    } else if (::fcntl(fd, F_SETLEASE, F_UNLCK) != 0) {
        out_error = std::strerror(errno);
        out_status = ShredStatus::IoError;
        return nullptr;
    }
#endif

    out_status = ShredStatus::Ok;
    return target;
#endif
}

ShredStatus FileSystemStorage::Rename(const std::string& from, const std::string& to, std::string& out_error) {
    std::error_code ec;
    std::filesystem::rename(PathFromUtf8(from), PathFromUtf8(to), ec);
    if (ec) {
        out_error = ec.message();
        return ShredStatus::IoError;
    }
    return ShredStatus::Ok;
}

ShredStatus FileSystemStorage::Remove(const std::string& path, std::string& out_error) {
    std::error_code ec;
    const bool removed = std::filesystem::remove(PathFromUtf8(path), ec);
    if (ec) {
        out_error = ec.message();
        return ShredStatus::UnlinkFailed;
    }
    if (!removed) {
        out_error = "no such file";
        return ShredStatus::UnlinkFailed;
    }
    return ShredStatus::Ok;
}

}  // namespace safeshred
