#include "compute/console.hpp"

#include <iostream>

namespace compute {

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║       Пакетное вычисление арифметических выражений        ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printInfo(const std::string& message) {
    std::cout << Color::GRAY << "• " << Color::RESET << message << "\n";
}

void printSuccess(const std::string& message) {
    std::cout << Color::GREEN << "✓ " << Color::RESET << message << "\n";
}

void printWarning(const std::string& message) {
    std::cout << Color::YELLOW << "Внимание: " << Color::RESET << message << "\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n";
}

} // namespace compute
