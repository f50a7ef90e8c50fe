#include "compute/file_utils.hpp"

#include <fstream>
#include <stdexcept>

namespace compute {

std::vector<std::string> readExpressionLines(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Файл не найден: " + path.string());
    }

    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    std::vector<std::string> lines;
    std::string buffer;
    while (std::getline(input, buffer)) {
        // Файлы с переводами строк Windows
        if (!buffer.empty() && buffer.back() == '\r') {
            buffer.pop_back();
        }
        lines.push_back(std::move(buffer));
    }

    if (input.bad()) {
        throw std::runtime_error("Ошибка чтения входного файла: " + path.string());
    }
    return lines;
}

std::filesystem::path defaultReportPath(const std::filesystem::path& inputPath) {
    std::filesystem::path report = inputPath;
    report.replace_filename(inputPath.stem().string() + "_results.csv");
    return report;
}

} // namespace compute
