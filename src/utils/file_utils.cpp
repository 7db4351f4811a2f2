#include "utils/file_utils.hpp"

#include <fstream>
#include <system_error>

#include "utils/logger.hpp"

namespace {
// Множество пробельных символов (аналогично std::isspace())
constexpr char SPACES[] = " \t\n\r\f\v";
} // namespace

namespace squid::utils {
bool isFileReadable(const std::filesystem::path &filePath)
{
    LOG_DEBUG << "Проверка файла на чтение: " << filePath.string();

    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        if (ec) {
            LOG_ERROR << "Ошибка при проверке существования файла: " << filePath.string()
                      << ", код ошибки: " << ec.value() << ", сообщение: " << ec.message();
        }
        else {
            LOG_DEBUG << "Файл не существует: " << filePath.string();
        }
        return false;
    }

    if (std::filesystem::is_directory(filePath, ec)) {
        LOG_DEBUG << "По указанному пути находится директория, а не файл: " << filePath.string();
        return false;
    }

    // Пытаемся открыть файл для чтения, чтобы убедиться в доступности
    std::ifstream testFile(filePath);
    const auto readable = testFile.good();
    if (!readable) {
        LOG_DEBUG << "Файл существует, но недоступен для чтения: " << filePath.string();
    }
    return readable;
}

bool safeFileRead(const std::filesystem::path &filePath, std::string &data)
{
    LOG_DEBUG << "Безопасное чтение файла: " << filePath.string();

    if (!isFileReadable(filePath)) {
        LOG_DEBUG << "Файл не доступен для чтения: " << filePath.string();
        return false;
    }

    std::ifstream inFile(filePath, std::ios::binary | std::ios::ate);
    if (!inFile) {
        LOG_ERROR << "Не удалось открыть файл для чтения: " << filePath.string();
        return false;
    }

    const std::streamoff fileSize = inFile.tellg();
    if (fileSize < 0) {
        LOG_ERROR << "Ошибка при определении размера файла: " << filePath.string();
        return false;
    }

    data.resize(static_cast<size_t>(fileSize));
    inFile.seekg(0);
    inFile.read(&data[0], fileSize);

    if (inFile.gcount() != fileSize) {
        LOG_ERROR << "Ошибка при чтении: " << filePath.string() << ", прочитано " << inFile.gcount()
                  << " байт из " << fileSize << " ожидаемых";
        return false;
    }

    LOG_DEBUG << "Успешно прочитано " << fileSize << " байт: " << filePath.string();
    return true;
}

std::string trim(const std::string &input)
{
    const auto start = input.find_first_not_of(SPACES);
    if (start == std::string::npos) {
        // Строка состоит только из пробелов
        return {};
    }
    const auto end = input.find_last_not_of(SPACES);
    return input.substr(start, end - start + 1);
}
} // namespace squid::utils
