#include "compute/csv_writer.hpp"

#include <stdexcept>

namespace compute {

std::string escapeCsvField(const std::string& field) {
    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped += '"';
    for (char ch : field) {
        if (ch == '"') {
            escaped += '"';
        }
        escaped += ch;
    }
    escaped += '"';
    return escaped;
}

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : target(std::move(targetPath)), stream(target, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + target.string());
    }
    stream << "line,expression,status,kind,result,message\n";
}

void CsvWriter::writeRecord(std::size_t lineNumber, const EvaluationResult& record) {
    stream << lineNumber << ',' << escapeCsvField(record.expression) << ',';

    if (record.value.ok()) {
        // Числа пишутся кратчайшей записью, восстанавливающей точное значение
        stream << "success,," << formatNumber(record.value.value()) << ",\"\"\n";
    } else {
        const ComputeError& error = record.value.error();
        stream << "error," << toString(error.kind) << ",," << escapeCsvField(error.describe()) << '\n';
    }

    if (!stream) {
        throw std::runtime_error("Ошибка записи в файл CSV: " + target.string());
    }
}

void CsvWriter::write(const std::vector<EvaluationResult>& records, std::size_t firstLine) {
    for (std::size_t i = 0; i < records.size(); ++i) {
        writeRecord(firstLine + i, records[i]);
    }
    stream.flush();
}

} // namespace compute
