/**
 * @file test_trash.cpp
 * @brief Unit tests for the trash backends and FileOperations
 *
 * The freedesktop backend is exercised against a private XDG data home, so
 * nothing ends up in the real user's trash.
 *
 * @see Trash
 * @see FileOperations
 */

#include <gtest/gtest.h>
#include "errors.hpp"
#include "fileoperations.hpp"
#include "trash.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class TrashTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path home;
    fs::path data_home;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("lazyscan_trash_" + generateUuid());
        fs::create_directories(test_dir / "home");
        test_dir = fs::canonical(test_dir);
        home = test_dir / "home";
        data_home = home / ".local" / "share";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void createFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    Trash linuxTrash() const {
        return Trash(TrashBackend::Linux, home, data_home);
    }
};

TEST_F(TrashTest, ProbeCreatesFreedesktopLayout) {
    EXPECT_EQ(probeTrashBackend(Platform::Linux, home, data_home), TrashBackend::Linux);
    EXPECT_TRUE(fs::is_directory(data_home / "Trash" / "files"));
    EXPECT_TRUE(fs::is_directory(data_home / "Trash" / "info"));
    EXPECT_EQ(trashBackendName(TrashBackend::Linux), "freedesktop");
}

TEST_F(TrashTest, ProbeWithoutDataHomeIsUnavailable) {
    EXPECT_EQ(probeTrashBackend(Platform::Linux, home, fs::path()), TrashBackend::Unavailable);
}

TEST_F(TrashTest, ProbeFailsWhenDataHomeIsAFile) {
    createFile(data_home, "not a directory");
    EXPECT_EQ(probeTrashBackend(Platform::Linux, home, data_home), TrashBackend::Unavailable);
}

/**
 * @test MovesFileAndWritesTrashInfo
 * @brief The item lands in Trash/files with a matching .trashinfo entry
 */
TEST_F(TrashTest, MovesFileAndWritesTrashInfo) {
    fs::path target = home / ".cache" / "my file.log";
    createFile(target, "log data");

    Trash trash = linuxTrash();
    fs::path location = trash.moveToTrash(target);

    EXPECT_FALSE(fs::exists(target));
    EXPECT_EQ(location, data_home / "Trash" / "files" / "my file.log");
    EXPECT_EQ(readFile(location), "log data");
    EXPECT_EQ(trash.trashDirectory(), data_home / "Trash");

    std::string info = readFile(data_home / "Trash" / "info" / "my file.log.trashinfo");
    EXPECT_EQ(info.rfind("[Trash Info]\n", 0), 0u);
    EXPECT_NE(info.find("Path=" + (home / ".cache").string() + "/my%20file.log\n"),
              std::string::npos);
    EXPECT_NE(info.find("DeletionDate="), std::string::npos);
}

TEST_F(TrashTest, MovesDirectories) {
    fs::path target = home / "Library" / "Cache";
    createFile(target / "a" / "b.bin", "bytes");

    fs::path location = linuxTrash().moveToTrash(target);

    EXPECT_FALSE(fs::exists(target));
    EXPECT_EQ(readFile(location / "a" / "b.bin"), "bytes");
}

TEST_F(TrashTest, NameCollisionsGetNumberedEntries) {
    Trash trash = linuxTrash();

    createFile(home / "one" / "cache", "first");
    createFile(home / "two" / "cache", "second");
    createFile(home / "three" / "cache", "third");

    fs::path first = trash.moveToTrash(home / "one" / "cache");
    fs::path second = trash.moveToTrash(home / "two" / "cache");
    fs::path third = trash.moveToTrash(home / "three" / "cache");

    EXPECT_EQ(first.filename(), "cache");
    EXPECT_EQ(second.filename(), "cache.2");
    EXPECT_EQ(third.filename(), "cache.3");
    EXPECT_EQ(readFile(second), "second");
    EXPECT_TRUE(fs::exists(data_home / "Trash" / "info" / "cache.3.trashinfo"));
}

TEST_F(TrashTest, MissingTargetLeavesNoInfoFile) {
    Trash trash = linuxTrash();
    fs::create_directories(data_home / "Trash" / "info");

    EXPECT_THROW(trash.moveToTrash(home / "does-not-exist"), PlatformError);
    EXPECT_TRUE(fs::is_empty(data_home / "Trash" / "info"));
}

/**
 * @test UnavailableBackendNeverDeletes
 * @brief Without a trash the target is left alone and PlatformError is thrown
 */
TEST_F(TrashTest, UnavailableBackendNeverDeletes) {
    fs::path target = home / "keep.txt";
    createFile(target, "keep");

    Trash trash(TrashBackend::Unavailable, home, data_home);
    EXPECT_THROW(trash.moveToTrash(target), PlatformError);
    EXPECT_TRUE(fs::exists(target));
    EXPECT_TRUE(trash.trashDirectory().empty());
}

TEST_F(TrashTest, MacTrashUsesUniqueNames) {
    fs::create_directories(home / ".Trash");
    Trash trash(TrashBackend::MacOS, home, data_home);

    createFile(home / "a" / "Caches", "1");
    createFile(home / "b" / "Caches", "2");

    EXPECT_EQ(trash.moveToTrash(home / "a" / "Caches"), home / ".Trash" / "Caches");
    EXPECT_EQ(trash.moveToTrash(home / "b" / "Caches"), home / ".Trash" / "Caches.2");
}

TEST_F(TrashTest, FileOperationsRefuseSymlinks) {
    Trash trash = linuxTrash();
    FileOperations files(trash);

    createFile(home / "real.txt", "real");
    fs::create_symlink(home / "real.txt", home / "link");

    EXPECT_TRUE(files.exists(home / "link"));
    EXPECT_THROW(files.moveToTrash(home / "link"), DeletionSafetyError);
    EXPECT_THROW(files.removePermanently(home / "link"), DeletionSafetyError);
    EXPECT_TRUE(fs::is_symlink(home / "link"));
    EXPECT_TRUE(fs::exists(home / "real.txt"));
}

TEST_F(TrashTest, FileOperationsRemoveAndMeasure) {
    Trash trash = linuxTrash();
    FileOperations files(trash);

    createFile(home / "dir" / "a", "12345");
    createFile(home / "dir" / "b", "678");

    EXPECT_EQ(files.totalSize(home / "dir"), 8u);
    EXPECT_GT(files.removePermanently(home / "dir"), 0u);
    EXPECT_FALSE(files.exists(home / "dir"));
}
