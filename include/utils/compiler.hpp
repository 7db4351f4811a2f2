#pragma once

#include <cstdlib>
#include <sstream>

#include "utils/logger.hpp"

// Неустранимая ошибка окружения: сообщение попадает в лог (или stderr), процесс завершается
#define FATAL_ERROR(reason)                                                                        \
    do {                                                                                           \
        std::ostringstream squidFatalStream_;                                                      \
        squidFatalStream_ << reason;                                                               \
        squid::utils::Logger::getInstance().fatal(squidFatalStream_.str(), __FILE__, __LINE__);    \
    } while (0)

