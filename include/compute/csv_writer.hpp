#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "compute/batch_evaluator.hpp"

namespace compute {

// Экранирование поля CSV: поле берется в кавычки, кавычки внутри удваиваются
std::string escapeCsvField(const std::string& field);

// Запись результатов пакета в CSV.
// Формат строки: line,expression,status,kind,result,message
class CsvWriter {
public:
    // Открывает файл (перезаписывая его) и пишет заголовок.
    // Выбрасывает std::runtime_error, если файл не удалось открыть.
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает один результат; lineNumber: номер строки во входном файле
    void writeRecord(std::size_t lineNumber, const EvaluationResult& record);

    // Записывает пакет; нумерация строк начинается с firstLine
    void write(const std::vector<EvaluationResult>& records, std::size_t firstLine = 1);

    const std::filesystem::path& path() const { return target; }

private:
    std::filesystem::path target;
    std::ofstream stream;
};

} // namespace compute
