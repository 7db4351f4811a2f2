#include "testing_utils.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <random>

#include "utils/logger.hpp"

namespace {
// Базовая часть наименования временных директорий
static const char tmpDirBase[] = "squid_test_";
} // namespace

namespace squid::tests {
ScriptedClock::ScriptedClock(std::deque<int64_t> millis)
    : millis_(std::move(millis))
{
}

std::chrono::milliseconds ScriptedClock::sinceEpoch()
{
    calls_++;
    if (!millis_.empty()) {
        last_ = millis_.front();
        millis_.pop_front();
    }
    return std::chrono::milliseconds(last_);
}

void ScriptedClock::push(int64_t millis)
{
    millis_.push_back(millis);
}

size_t ScriptedClock::calls() const
{
    return calls_;
}

FixedMachineIdProvider::FixedMachineIdProvider(std::optional<std::string> result)
    : result_(std::move(result))
{
}

std::optional<std::string> FixedMachineIdProvider::resolve() const
{
    calls_++;
    return result_;
}

size_t FixedMachineIdProvider::calls() const
{
    return calls_;
}

std::string generateRandomId(size_t length)
{
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    // Для каждого потока создаем свой экземпляр генератора
    thread_local std::mt19937 rng(std::random_device {}());
    std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);

    std::string result(length, '0');
    for (auto &symbol : result) {
        symbol = alphabet[dist(rng)];
    }
    return result;
}

std::filesystem::path createTmpDirectory(std::string_view suffix)
{
    const auto systemTmpDir = std::filesystem::temp_directory_path();
    const auto tmpDirBaseWithSuffix = tmpDirBase + std::string(suffix) + "_";
    std::filesystem::path tmpDir;
    do {
        tmpDir = systemTmpDir / (tmpDirBaseWithSuffix + generateRandomId(8));
    } while (std::filesystem::exists(tmpDir));

    std::error_code ec;
    const bool created = std::filesystem::create_directories(tmpDir, ec);
    EXPECT_TRUE(created);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(std::filesystem::is_directory(tmpDir));

    return tmpDir;
}

void removeTmpDirectory(const std::filesystem::path &tmpDir)
{
    if (!std::filesystem::exists(tmpDir)) {
        return;
    }

    // Проверяем, что это действительно временная тестовая директория
    const auto dirName = tmpDir.filename().string();
    EXPECT_TRUE(dirName.find(tmpDirBase) == 0);

    std::error_code ec;
    std::filesystem::remove_all(tmpDir, ec);
    if (ec) {
        LOG_WARNING << "Ошибка при удалении тестовой директории: " << tmpDir.string()
                    << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
    }
}

void writeFile(const std::filesystem::path &filePath, const std::string &content)
{
    std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(file.good()) << "Не удалось открыть файл: " << filePath.string();
    file << content;
}
} // namespace squid::tests
