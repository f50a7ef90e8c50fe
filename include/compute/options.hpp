#pragma once

#include <atomic>
#include <cstddef>

namespace compute {

// Настройки грамматики и парсера.
// Значения по умолчанию соответствуют канонической грамматике.
struct ParserOptions {
    // Разрешить экспоненциальную запись чисел (1e10, 2.5E-3)
    bool allowScientificNotation = false;

    // Предельная глубина вложенности скобок и унарных минусов
    std::size_t maxDepth = 1000;
};

// Настройки пакетного вычисления
struct BatchOptions {
    // Количество рабочих потоков; 1 означает последовательное вычисление в вызывающем потоке
    std::size_t threadCount = 1;

    // Счетчик завершенных выражений для отображения прогресса (может быть nullptr)
    std::atomic<std::size_t>* progress = nullptr;
};

} // namespace compute
