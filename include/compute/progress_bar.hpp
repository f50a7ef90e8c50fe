#pragma once

#include <atomic>
#include <cstddef>
#include <string>

namespace compute {

// Строка прогресс-бара: "[███▒░░...] 42% (42/100)". Ширина полосы 50 ячеек;
// при total == 0 полоса считается заполненной.
std::string renderProgress(std::size_t current, std::size_t total);

// Перерисовывает прогресс-бар, пока completed не достигнет total.
// Запускается в отдельном потоке.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total);

} // namespace compute
