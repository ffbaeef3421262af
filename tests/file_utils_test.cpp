#include "test_base.hpp"
#include "core/file_utils.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class FileUtilsTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();

        // Create test directory structure
        fs::create_directories(test_dir_ / "subdir1");
        fs::create_directories(test_dir_ / "subdir2");

        std::ofstream(testPath("gel1.tif")).close();
        std::ofstream(testPath("blot2.PNG")).close();
        std::ofstream(testPath("notes.txt")).close();
        std::ofstream(testPath("subdir1/gel3.jpeg")).close();
        std::ofstream(testPath("subdir2/readme")).close();
    }

    const std::vector<std::string> extensions_ = {"tif", "tiff", "png", "jpg", "jpeg"};
};

TEST_F(FileUtilsTest, ListFilesNonRecursive)
{
    std::vector<std::string> files;
    bool completed = false;
    bool error_occurred = false;

    auto observable = FileUtils::listFilesAsObservable(test_dir_.string(), false);
    observable.subscribe(
        [&files](const std::string &file_path)
        {
            files.push_back(file_path);
        },
        [&error_occurred](const std::exception &e)
        {
            error_occurred = true;
            FAIL() << "Unexpected error in file listing: " << e.what();
        },
        [&completed]()
        {
            completed = true;
        });

    EXPECT_EQ(files.size(), 3u);
    EXPECT_TRUE(completed);
    EXPECT_FALSE(error_occurred);
}

TEST_F(FileUtilsTest, ListFilesRecursive)
{
    std::vector<std::string> files;
    bool completed = false;

    FileUtils::listFilesAsObservable(test_dir_.string(), true)
        .subscribe(
            [&files](const std::string &file_path)
            {
                files.push_back(file_path);
            },
            [&completed]()
            {
                completed = true;
            });

    EXPECT_EQ(files.size(), 5u);
    EXPECT_TRUE(completed);
}

TEST_F(FileUtilsTest, InvalidDirectory)
{
    bool error_occurred = false;
    FileUtils::listFilesAsObservable(testPath("nonexistent"), false)
        .subscribe(
            [](const std::string &) {},
            [&error_occurred](const std::exception &)
            {
                error_occurred = true;
            });

    EXPECT_TRUE(error_occurred);
    EXPECT_FALSE(FileUtils::isValidDirectory(testPath("nonexistent")));
    EXPECT_FALSE(FileUtils::isValidDirectory(testPath("gel1.tif")));
    EXPECT_TRUE(FileUtils::isValidDirectory(test_dir_.string()));
}

TEST_F(FileUtilsTest, ListImageFilesFiltersAndSorts)
{
    auto files = FileUtils::listImageFiles(test_dir_.string(), false, extensions_);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(fs::path(files[0]).filename().string(), "blot2.PNG");
    EXPECT_EQ(fs::path(files[1]).filename().string(), "gel1.tif");

    auto all = FileUtils::listImageFiles(test_dir_.string(), true, extensions_);
    EXPECT_EQ(all.size(), 3u);
}

TEST_F(FileUtilsTest, ListImageFilesThrowsForMissingFolder)
{
    EXPECT_THROW(FileUtils::listImageFiles(testPath("nonexistent"), false, extensions_), std::runtime_error);
}

TEST_F(FileUtilsTest, FileExtensionIsLowercaseWithoutDot)
{
    EXPECT_EQ(FileUtils::getFileExtension("/data/gel.TIF"), "tif");
    EXPECT_EQ(FileUtils::getFileExtension("archive.tar.gz"), "gz");
    EXPECT_EQ(FileUtils::getFileExtension("README"), "");
    EXPECT_TRUE(FileUtils::hasExtension("blot.JPeG", extensions_));
    EXPECT_FALSE(FileUtils::hasExtension("notes.txt", extensions_));
    EXPECT_FALSE(FileUtils::hasExtension("README", extensions_));
}

TEST_F(FileUtilsTest, ReadFileBytes)
{
    const std::string path = testPath("data.bin");
    {
        std::ofstream out(path, std::ios::binary);
        out << "0123456789";
    }

    auto all = FileUtils::readFileBytes(path);
    EXPECT_EQ(all.size(), 10u);
    EXPECT_EQ(all.front(), '0');

    auto head = FileUtils::readFileBytes(path, 4);
    ASSERT_EQ(head.size(), 4u);
    EXPECT_EQ(head.back(), '3');

    EXPECT_THROW(FileUtils::readFileBytes(testPath("missing.bin")), std::runtime_error);
}
