#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace compute {

// Читает входной файл построчно. Пустые строки сохраняются, чтобы номера строк
// результатов совпадали с номерами строк файла; завершающий '\r' отбрасывается.
// Выбрасывает std::runtime_error, если файл не найден или не открывается.
std::vector<std::string> readExpressionLines(const std::filesystem::path& path);

// Путь к CSV-отчету по умолчанию: рядом с входным файлом, "<имя>_results.csv"
std::filesystem::path defaultReportPath(const std::filesystem::path& inputPath);

} // namespace compute
