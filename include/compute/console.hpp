#pragma once

#include <string>

namespace compute {

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

// Заголовок программы
void printHeader();

// Сообщения в терминал: ошибки пишутся в stderr, остальное в stdout
void printInfo(const std::string& message);
void printSuccess(const std::string& message);
void printWarning(const std::string& message);
void printError(const std::string& message);

} // namespace compute
