#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "testing_utils.hpp"
#include "utils/file_utils.hpp"

namespace squid::tests {
class FileUtilsTest : public ::testing::Test {
protected:
    std::filesystem::path testDir; // Путь к тестовой директории

    void SetUp() override
    {
        testDir = createTmpDirectory("FileUtils");
    }

    void TearDown() override
    {
        removeTmpDirectory(testDir);
    }
};

// Проверка доступности файлов для чтения
TEST_F(FileUtilsTest, FileUtilsTestIsFileReadable)
{
    const auto file = testDir / "readable.txt";
    writeFile(file, "data");

    EXPECT_TRUE(utils::isFileReadable(file));
    EXPECT_FALSE(utils::isFileReadable(testDir / "missing.txt"));
    EXPECT_FALSE(utils::isFileReadable(testDir));
}

// Чтение всего содержимого файла, включая бинарные данные
TEST_F(FileUtilsTest, FileUtilsTestSafeFileRead)
{
    const auto file = testDir / "content.bin";
    const std::string content("line1\nline2\0tail", 16);
    writeFile(file, content);

    std::string data;
    ASSERT_TRUE(utils::safeFileRead(file, data));
    EXPECT_EQ(content, data);

    const auto emptyFile = testDir / "empty.txt";
    writeFile(emptyFile, "");
    ASSERT_TRUE(utils::safeFileRead(emptyFile, data));
    EXPECT_TRUE(data.empty());
}

// Ошибки чтения
TEST_F(FileUtilsTest, FileUtilsTestSafeFileReadFailures)
{
    std::string data = "untouched";
    EXPECT_FALSE(utils::safeFileRead(testDir / "missing.txt", data));
    EXPECT_FALSE(utils::safeFileRead(testDir, data));
}

// Удаление пробельных символов по краям строки
TEST_F(FileUtilsTest, FileUtilsTestTrim)
{
    EXPECT_EQ("abc", utils::trim("abc"));
    EXPECT_EQ("abc", utils::trim(" \t abc\r\n"));
    EXPECT_EQ("a b", utils::trim("  a b  "));
    EXPECT_EQ("", utils::trim(" \n\t "));
    EXPECT_EQ("", utils::trim(""));
}
} // namespace squid::tests
