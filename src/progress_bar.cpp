#include "compute/progress_bar.hpp"
#include "compute/console.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace compute {

namespace {
constexpr std::size_t kBarWidth = 50;
constexpr auto kRedrawInterval = std::chrono::milliseconds(50);
}

std::string renderProgress(std::size_t current, std::size_t total) {
    std::size_t done = total == 0 ? 0 : std::min(current, total);
    std::size_t filled = total == 0 ? kBarWidth : done * kBarWidth / total;
    std::size_t percent = total == 0 ? 100 : done * 100 / total;

    std::string bar = "[";
    for (std::size_t cell = 0; cell < kBarWidth; ++cell) {
        if (cell < filled) {
            bar += "█";
        } else if (cell == filled) {
            bar += "▒";
        } else {
            bar += "░";
        }
    }
    bar += "] ";

    std::string percentText = std::to_string(percent);
    bar += std::string(3 - std::min<std::size_t>(3, percentText.size()), ' ') + percentText + "%";
    bar += " (" + std::to_string(done) + "/" + std::to_string(total) + ")";
    return bar;
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total) {
    if (total == 0) {
        return;
    }

    for (std::size_t current = completed.load(); current < total; current = completed.load()) {
        std::cout << "\r  " << Color::CYAN << renderProgress(current, total) << Color::RESET;
        std::cout.flush();
        std::this_thread::sleep_for(kRedrawInterval);
    }

    // Финальная отрисовка до 100%
    std::cout << "\r  " << Color::GREEN << renderProgress(total, total) << Color::RESET << "\n";
}

} // namespace compute
