#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

#include "safeshred/shred_engine.hpp"
#include "safeshred/shred_storage.hpp"
#include "test_paths.hpp"

using safeshred::FileSystemStorage;
using safeshred::IShredStorage;
using safeshred::IShredTarget;
using safeshred::ShredEngine;
using safeshred::ShredOptions;
using safeshred::ShredRequest;
using safeshred::ShredResult;
using safeshred::ShredStatus;
using safeshred::TargetInfo;

namespace {

// Real filesystem storage whose targets fail writes once a given pass starts.
class FaultInjectingStorage final : public IShredStorage {
public:
    explicit FaultInjectingStorage(const std::size_t failing_pass) : failing_pass_(failing_pass) {}

    ShredStatus Inspect(const std::string& path, TargetInfo& out_info, std::string& out_error) override {
        return inner_.Inspect(path, out_info, out_error);
    }

    std::unique_ptr<IShredTarget> OpenExclusive(
        const std::string& path,
        ShredStatus& out_status,
        std::string& out_error) override {
        std::unique_ptr<IShredTarget> target = inner_.OpenExclusive(path, out_status, out_error);
        if (target == nullptr) {
            return nullptr;
        }
        return std::make_unique<FaultyTarget>(std::move(target), failing_pass_);
    }

    ShredStatus Rename(const std::string& from, const std::string& to, std::string& out_error) override {
        return inner_.Rename(from, to, out_error);
    }

    ShredStatus Remove(const std::string& path, std::string& out_error) override {
        return inner_.Remove(path, out_error);
    }

private:
    class FaultyTarget final : public IShredTarget {
    public:
        FaultyTarget(std::unique_ptr<IShredTarget> inner, const std::size_t failing_pass)
            : inner_(std::move(inner)), failing_pass_(failing_pass) {}

        ShredStatus Size(std::uint64_t& out_size) override { return inner_->Size(out_size); }

        ShredStatus WriteAt(std::uint64_t offset, const std::uint8_t* data, std::size_t length) override {
            if (pass_ == failing_pass_) {
                return ShredStatus::IoError;
            }
            return inner_->WriteAt(offset, data, length);
        }

        ShredStatus Sync() override {
            ++pass_;
            return inner_->Sync();
        }

        ShredStatus Truncate() override { return inner_->Truncate(); }
        ShredStatus Close() override { return inner_->Close(); }
        std::string LastError() const override { return "simulated device error"; }

    private:
        std::unique_ptr<IShredTarget> inner_;
        std::size_t failing_pass_;
        std::size_t pass_ = 1;
    };

    FileSystemStorage inner_;
    std::size_t failing_pass_;
};

std::vector<std::uint8_t> Sample(const std::size_t n) {
    std::vector<std::uint8_t> bytes(n);
    for (std::size_t i = 0; i < n; ++i) {
        bytes[i] = static_cast<std::uint8_t>('A' + (i % 26));
    }
    return bytes;
}

}  // namespace

class FileSystemShredTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = safeshred::test::MakeScratchDir();
        data_ = root_ / "data";
        std::filesystem::create_directories(data_);
        ASSERT_TRUE(logger_.Init((root_ / "shred.log").string()));
    }

    void TearDown() override {
        logger_.Close();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::size_t DataEntries() const {
        return static_cast<std::size_t>(std::distance(
            std::filesystem::directory_iterator(data_), std::filesystem::directory_iterator()));
    }

    std::filesystem::path root_;
    std::filesystem::path data_;
    safeshred::ShredLogger logger_;
    FileSystemStorage storage_;
};

TEST_F(FileSystemShredTest, ShreddedFileCannotBeOpenedAgain) {
    const std::filesystem::path file = data_ / "secret.txt";
    safeshred::test::WriteBytes(file, Sample(10));
    ShredEngine engine(logger_, storage_);

    std::vector<int> progress;
    const ShredResult result = engine.Shred(ShredRequest{file.string(), 3}, [&](const int p) { progress.push_back(p); });

    ASSERT_TRUE(result.Succeeded()) << result.detail;
    EXPECT_EQ(result.warning, ShredStatus::Ok);
    EXPECT_EQ(result.passes_completed, 3U);
    EXPECT_EQ(result.bytes_processed, 30U);
    EXPECT_EQ(progress, (std::vector<int>{33, 66, 100}));

    std::ifstream reopened(file, std::ios::binary);
    EXPECT_FALSE(reopened.is_open());
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_EQ(DataEntries(), 0U);
}

TEST_F(FileSystemShredTest, LargerThanBufferFileIsShredded) {
    const std::filesystem::path file = data_ / "large.bin";
    safeshred::test::WriteBytes(file, Sample(200 * 1024 + 7));
    ShredOptions options;
    options.buffer_size = 4096;
    ShredEngine engine(logger_, storage_, options);

    const ShredResult result = engine.Shred(ShredRequest{file.string(), 2});

    ASSERT_TRUE(result.Succeeded()) << result.detail;
    EXPECT_EQ(result.bytes_processed, 2U * (200U * 1024U + 7U));
    EXPECT_EQ(DataEntries(), 0U);
}

TEST_F(FileSystemShredTest, EmptyFileIsRemoved) {
    const std::filesystem::path file = data_ / "empty";
    safeshred::test::WriteBytes(file, {});
    ShredEngine engine(logger_, storage_);

    const ShredResult result = engine.Shred(ShredRequest{file.string(), 2});

    ASSERT_TRUE(result.Succeeded()) << result.detail;
    EXPECT_EQ(result.bytes_processed, 0U);
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(FileSystemShredTest, InjectedFailureLeavesPassOneContentOnDisk) {
    const std::filesystem::path file = data_ / "partial.bin";
    safeshred::test::WriteBytes(file, Sample(10));
    FaultInjectingStorage faulty(2);
    ShredEngine engine(logger_, faulty);

    const ShredResult result = engine.Shred(ShredRequest{file.string(), 5});

    EXPECT_EQ(result.status, ShredStatus::IoError);
    EXPECT_EQ(result.passes_completed, 1U);
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(safeshred::test::ReadBytes(file), std::vector<std::uint8_t>(10, 0x00));
}

TEST_F(FileSystemShredTest, MissingPathIsInvalidArgument) {
    ShredEngine engine(logger_, storage_);
    EXPECT_EQ(engine.Shred(ShredRequest{(data_ / "absent").string(), 1}).status, ShredStatus::InvalidArgument);
}

TEST_F(FileSystemShredTest, DirectoryIsInvalidArgument) {
    const std::filesystem::path dir = data_ / "sub";
    std::filesystem::create_directories(dir);
    ShredEngine engine(logger_, storage_);

    EXPECT_EQ(engine.Shred(ShredRequest{dir.string(), 1}).status, ShredStatus::InvalidArgument);
    EXPECT_TRUE(std::filesystem::is_directory(dir));
}

TEST_F(FileSystemShredTest, ReadOnlyFileIsAccessDeniedAndUntouched) {
    const std::filesystem::path file = data_ / "readonly.txt";
    safeshred::test::WriteBytes(file, Sample(16));
    std::filesystem::permissions(
        file,
        std::filesystem::perms::owner_write | std::filesystem::perms::group_write | std::filesystem::perms::others_write,
        std::filesystem::perm_options::remove);
    ShredEngine engine(logger_, storage_);

    const ShredResult result = engine.Shred(ShredRequest{file.string(), 3});

    EXPECT_EQ(result.status, ShredStatus::AccessDenied);
    EXPECT_EQ(result.passes_completed, 0U);
    EXPECT_EQ(safeshred::test::ReadBytes(file), Sample(16));
}

TEST_F(FileSystemShredTest, KeepNameUnlinksOriginalEntry) {
    const std::filesystem::path file = data_ / "plain.txt";
    safeshred::test::WriteBytes(file, Sample(64));
    ShredOptions options;
    options.obfuscate_name = false;
    options.truncate_after = false;
    ShredEngine engine(logger_, storage_, options);

    ASSERT_TRUE(engine.Shred(ShredRequest{file.string(), 1}).Succeeded());
    EXPECT_EQ(DataEntries(), 0U);
}

#ifndef _WIN32

TEST_F(FileSystemShredTest, SymlinkTargetIsShreddedAndLinkIsKept) {
    const std::filesystem::path target = data_ / "target.txt";
    const std::filesystem::path link = data_ / "link.txt";
    safeshred::test::WriteBytes(target, Sample(32));
    std::filesystem::create_symlink(target, link);
    ShredEngine engine(logger_, storage_);

    const ShredResult result = engine.Shred(ShredRequest{link.string(), 2});

    ASSERT_TRUE(result.Succeeded()) << result.detail;
    EXPECT_EQ(result.bytes_processed, 64U);
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::is_symlink(std::filesystem::symlink_status(link)));
}

TEST_F(FileSystemShredTest, DanglingSymlinkIsInvalidArgument) {
    const std::filesystem::path link = data_ / "dangling";
    std::filesystem::create_symlink(data_ / "gone", link);
    ShredEngine engine(logger_, storage_);

    EXPECT_EQ(engine.Shred(ShredRequest{link.string(), 1}).status, ShredStatus::InvalidArgument);
}

TEST_F(FileSystemShredTest, FileLockedElsewhereIsAccessDenied) {
    const std::filesystem::path file = data_ / "locked.bin";
    safeshred::test::WriteBytes(file, Sample(10));
    const int holder = ::open(file.c_str(), O_RDONLY);
    ASSERT_GE(holder, 0);
    ASSERT_EQ(::flock(holder, LOCK_EX | LOCK_NB), 0);
    ShredEngine engine(logger_, storage_);

    const ShredResult result = engine.Shred(ShredRequest{file.string(), 3});
    ::close(holder);

    EXPECT_EQ(result.status, ShredStatus::AccessDenied);
    EXPECT_EQ(safeshred::test::ReadBytes(file), Sample(10));
}

#ifdef __linux__
TEST_F(FileSystemShredTest, FileOpenElsewhereIsAccessDenied) {
    const std::filesystem::path file = data_ / "open.bin";
    safeshred::test::WriteBytes(file, Sample(10));
    const int holder = ::open(file.c_str(), O_RDWR);
    ASSERT_GE(holder, 0);
    ShredEngine engine(logger_, storage_);

    const ShredResult result = engine.Shred(ShredRequest{file.string(), 3});
    ::close(holder);

    EXPECT_EQ(result.status, ShredStatus::AccessDenied);
    EXPECT_EQ(result.passes_completed, 0U);
    EXPECT_EQ(safeshred::test::ReadBytes(file), Sample(10));

    // Once the other descriptor is gone the same file shreds normally.
    EXPECT_TRUE(engine.Shred(ShredRequest{file.string(), 1}).Succeeded());
    EXPECT_FALSE(std::filesystem::exists(file));
}
#endif

TEST_F(FileSystemShredTest, FileInUntraversableDirectoryIsAccessDenied) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "directory permissions do not bind root";
    }
    const std::filesystem::path locked = data_ / "locked";
    std::filesystem::create_directories(locked);
    const std::filesystem::path file = locked / "f.bin";
    safeshred::test::WriteBytes(file, Sample(8));
    std::filesystem::permissions(locked, std::filesystem::perms::none);
    ShredEngine engine(logger_, storage_);

    const ShredResult result = engine.Shred(ShredRequest{file.string(), 1});
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

    EXPECT_EQ(result.status, ShredStatus::AccessDenied);
    EXPECT_EQ(safeshred::test::ReadBytes(file), Sample(8));
}

#endif
