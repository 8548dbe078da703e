/**
 * @file test_filescanner.cpp
 * @brief Unit tests for the FileScanner class
 *
 * This file contains Google Test unit tests that verify FileScanner
 * functionality: directory scanning, sorting, recursive traversal, symlink
 * handling, progress reporting and the size helpers used by scan reports.
 *
 * ## Test Coverage
 *
 * ### Basic Scanning
 * - ScansEmptyDirectory: Empty directory handling
 * - ScansFilesInDirectory: Regular file detection
 * - ScansDirectories: Mixed files and directories
 * - DetectsFileSize: Accurate size reporting (1 byte, 1 KB)
 *
 * ### Sorting Behavior
 * - SortsDirectoriesBeforeFiles: Directories precede files
 * - SortsAlphabetically: Alphabetical order within categories
 *
 * ### Traversal
 * - RecursiveScan: Deep directory traversal (3 levels)
 * - DoesNotFollowSymlinkedDirectories: Links are listed, not descended into
 * - HandlesNonExistentDirectory: Graceful handling of invalid paths
 *
 * ### Size Helpers
 * - LargestFilesOrdersBySize, DirectorySizeSumsTree, DirectorySizeIgnoresSymlinks
 *
 * @note Tests run in isolated temporary directories with automatic cleanup
 *
 * @see FileScanner
 * @see FileInfo
 */

#include <gtest/gtest.h>
#include "filescanner.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>

/**
 * @class FileScannerTest
 * @brief Test fixture for FileScanner unit tests
 *
 * Provides an isolated temporary test directory and helper methods for
 * creating test files and directories.
 */
class FileScannerTest : public ::testing::Test {
protected:
    /** @brief Path to temporary test directory */
    std::filesystem::path test_dir;

    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
                   ("lazyscan_scanner_" + generateUuid());
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    /**
     * @brief Creates a file in the test directory
     *
     * @param name Filename or relative path from test_dir
     * @param content String content to write to the file
     */
    void createFile(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    void createDir(const std::string& name) {
        std::filesystem::create_directories(test_dir / name);
    }

    static std::string nameOf(const FileInfo& info) {
        return std::filesystem::path(info.getPath()).filename().string();
    }
};

/**
 * @test ScansEmptyDirectory
 * @brief Verifies scanner handles empty directories correctly
 */
TEST_F(FileScannerTest, ScansEmptyDirectory) {
    FileScanner scanner;
    auto results = scanner.scanDirectory(test_dir, false);

    EXPECT_TRUE(results.empty());
}

/**
 * @test ScansFilesInDirectory
 * @brief Verifies detection and cataloging of regular files
 *
 * @see FileInfo::isDirectory()
 * @see FileInfo::getFileSize()
 */
TEST_F(FileScannerTest, ScansFilesInDirectory) {
    createFile("file1.txt", "content1");
    createFile("file2.txt", "content2");

    FileScanner scanner;
    auto results = scanner.scanDirectory(test_dir, false);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(nameOf(results[0]), "file1.txt");
    EXPECT_EQ(nameOf(results[1]), "file2.txt");

    for (const auto& info : results) {
        EXPECT_FALSE(info.isDirectory());
        EXPECT_FALSE(info.isSymlink());
        EXPECT_EQ(info.getFileSize(), 8u);
    }
}

TEST_F(FileScannerTest, ScansDirectories) {
    createDir("subdir1");
    createDir("subdir2");
    createFile("file.txt", "test");

    FileScanner scanner;
    auto results = scanner.scanDirectory(test_dir, false);

    ASSERT_EQ(results.size(), 3u);

    int dir_count = 0;
    int file_count = 0;
    for (const auto& info : results) {
        if (info.isDirectory()) {
            dir_count++;
            EXPECT_EQ(info.getSizeFormatted(), "<DIR>");
        } else {
            file_count++;
        }
    }

    EXPECT_EQ(dir_count, 2);
    EXPECT_EQ(file_count, 1);
}

TEST_F(FileScannerTest, DetectsFileSize) {
    createFile("small.txt", "x");
    createFile("medium.txt", std::string(1024, 'x'));

    FileScanner scanner;
    auto results = scanner.scanDirectory(test_dir, false);

    for (const auto& info : results) {
        if (nameOf(info) == "small.txt") {
            EXPECT_EQ(info.getFileSize(), 1u);
        } else if (nameOf(info) == "medium.txt") {
            EXPECT_EQ(info.getFileSize(), 1024u);
            EXPECT_EQ(info.getSizeFormatted(), "1.0 KB");
        }
    }
}

/**
 * @test SortsDirectoriesBeforeFiles
 * @brief Directories precede files regardless of name
 */
TEST_F(FileScannerTest, SortsDirectoriesBeforeFiles) {
    createFile("aaa.txt", "test");
    createDir("zzz_dir");

    FileScanner scanner;
    auto results = scanner.scanDirectory(test_dir, false);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].isDirectory());
    EXPECT_EQ(results[0].getDisplayName(), "zzz_dir/");
    EXPECT_FALSE(results[1].isDirectory());
}

TEST_F(FileScannerTest, SortsAlphabetically) {
    createFile("charlie.txt", "c");
    createFile("alpha.txt", "a");
    createFile("bravo.txt", "b");

    FileScanner scanner;
    auto results = scanner.scanDirectory(test_dir, false);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(nameOf(results[0]), "alpha.txt");
    EXPECT_EQ(nameOf(results[1]), "bravo.txt");
    EXPECT_EQ(nameOf(results[2]), "charlie.txt");
}

/**
 * @test RecursiveScan
 * @brief Deep traversal finds entries three levels down
 */
TEST_F(FileScannerTest, RecursiveScan) {
    createFile("level1/level2/level3/deep.txt", "deep");
    createFile("level1/mid.txt", "mid");

    FileScanner scanner;
    auto flat = scanner.scanDirectory(test_dir, false);
    auto deep = scanner.scanDirectory(test_dir, true);

    EXPECT_EQ(flat.size(), 1u);
    // 3 directories + 2 files
    EXPECT_EQ(deep.size(), 5u);

    bool found_deep = false;
    for (const auto& info : deep) {
        if (nameOf(info) == "deep.txt")
            found_deep = true;
    }
    EXPECT_TRUE(found_deep);
}

TEST_F(FileScannerTest, DoesNotFollowSymlinkedDirectories) {
    createFile("real/inside.txt", "data");
    std::filesystem::create_directory_symlink(test_dir / "real", test_dir / "link");

    FileScanner scanner;
    auto results = scanner.scanDirectory(test_dir, true);

    // real/, real/inside.txt and the link itself
    ASSERT_EQ(results.size(), 3u);
    int links = 0;
    for (const auto& info : results) {
        if (info.isSymlink()) {
            links++;
            EXPECT_FALSE(info.isDirectory());
            EXPECT_EQ(info.getFileSize(), 0u);
        }
    }
    EXPECT_EQ(links, 1);
}

TEST_F(FileScannerTest, HandlesNonExistentDirectory) {
    FileScanner scanner;
    auto results = scanner.scanDirectory(test_dir / "nonexistent", true);

    EXPECT_TRUE(results.empty());
}

TEST_F(FileScannerTest, ReportsProgress) {
    for (int i = 0; i < 25; ++i) {
        createFile("f" + std::to_string(i), "x");
    }

    std::vector<int> reported;

    FileScanner scanner;
    scanner.scanDirectory(test_dir, false, [&](int count) { reported.push_back(count); });

    // every 10 entries plus the final count
    ASSERT_EQ(reported.size(), 3u);
    EXPECT_EQ(reported.back(), 25);
}

TEST_F(FileScannerTest, LargestFilesOrdersBySize) {
    createFile("small", std::string(10, 'x'));
    createFile("large", std::string(300, 'x'));
    createFile("medium", std::string(100, 'x'));
    createDir("dir");

    FileScanner scanner;
    auto top = FileScanner::largestFiles(scanner.scanDirectory(test_dir, false), 2);

    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(nameOf(top[0]), "large");
    EXPECT_EQ(nameOf(top[1]), "medium");
}

TEST_F(FileScannerTest, DirectorySizeSumsTree) {
    createFile("tree/a", std::string(100, 'a'));
    createFile("tree/sub/b", std::string(50, 'b'));

    EXPECT_EQ(FileScanner::directorySize(test_dir / "tree"), 150u);
    EXPECT_EQ(FileScanner::directorySize(test_dir / "tree" / "a"), 100u);
    EXPECT_EQ(FileScanner::directorySize(test_dir / "missing"), 0u);
}

TEST_F(FileScannerTest, DirectorySizeIgnoresSymlinks) {
    createFile("big", std::string(1000, 'x'));
    createFile("tree/small", "x");
    std::filesystem::create_symlink(test_dir / "big", test_dir / "tree" / "link");

    EXPECT_EQ(FileScanner::directorySize(test_dir / "tree"), 1u);
    EXPECT_EQ(FileScanner::directorySize(test_dir / "tree" / "link"), 0u);
}
