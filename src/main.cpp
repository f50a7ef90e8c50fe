#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "compute/batch_evaluator.hpp"
#include "compute/console.hpp"
#include "compute/csv_writer.hpp"
#include "compute/file_utils.hpp"
#include "compute/progress_bar.hpp"

namespace {

using namespace compute;

constexpr int kExitSuccess = 0;
constexpr int kExitHasErrors = 1;
constexpr int kExitUsage = 2;

// Сколько ошибок показывать в терминале; полный список в CSV
constexpr std::size_t kMaxReportedErrors = 10;

struct CommandLine {
    std::filesystem::path input;
    std::optional<std::filesystem::path> output;
    std::size_t threadCount = 1;
    bool scientific = false;
};

void printUsage() {
    std::cout << Color::BOLD << "Использование:" << Color::RESET
        << " compute_batch <входной файл> [--output <отчет.csv>] [--threads N] [--scientific]\n\n"
        << "  --output, -o    путь к CSV-отчету (по умолчанию <имя>_results.csv рядом с входным файлом)\n"
        << "  --threads, -t   количество рабочих потоков (по умолчанию 1)\n"
        << "  --scientific    разрешить экспоненциальную запись чисел (1e10)\n";
}

// Безопасный разбор положительного числа из строки
std::size_t parsePositive(const std::string& value) {
    std::size_t parsed = 0;
    try {
        std::size_t consumed = 0;
        parsed = std::stoul(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    }
    catch (const std::logic_error&) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    if (parsed == 0) {
        throw std::runtime_error("Число должно быть положительным: " + value);
    }
    return parsed;
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine commandLine;
    bool hasInput = false;

    for (int i = 1; i < argc; ++i) {
        std::string argument = argv[i];
        auto requireValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Не указано значение для " + argument);
            }
            return argv[++i];
        };

        if (argument == "--output" || argument == "-o") {
            commandLine.output = requireValue();
        } else if (argument == "--threads" || argument == "-t") {
            commandLine.threadCount = parsePositive(requireValue());
        } else if (argument == "--scientific") {
            commandLine.scientific = true;
        } else if (!argument.empty() && argument[0] == '-') {
            throw std::runtime_error("Неизвестный параметр: " + argument);
        } else if (!hasInput) {
            commandLine.input = argument;
            hasInput = true;
        } else {
            throw std::runtime_error("Лишний аргумент: " + argument);
        }
    }

    if (!hasInput) {
        throw std::runtime_error("Не указан входной файл");
    }
    return commandLine;
}

// Вычисляет пакет, показывая прогресс в отдельном потоке
std::vector<EvaluationResult> evaluateWithProgress(const std::vector<std::string>& lines,
                                                   const CommandLine& commandLine) {
    ParserOptions parserOptions;
    parserOptions.allowScientificNotation = commandLine.scientific;

    std::atomic<std::size_t> completed{0};
    BatchOptions batchOptions;
    batchOptions.threadCount = commandLine.threadCount;
    batchOptions.progress = &completed;

    BatchEvaluator batch{ExpressionEvaluator(parserOptions), batchOptions};
    std::thread progressThread(displayProgress, std::cref(completed), lines.size());

    std::vector<EvaluationResult> results;
    try {
        results = batch.evaluate(lines);
    }
    catch (...) {
        // Останавливаем прогресс-бар и передаем исключение дальше
        completed.store(lines.size());
        progressThread.join();
        throw;
    }
    progressThread.join();
    return results;
}

void printErrors(const std::vector<EvaluationResult>& results) {
    std::size_t reported = 0;
    for (std::size_t i = 0; i < results.size() && reported < kMaxReportedErrors; ++i) {
        if (results[i].value.ok()) {
            continue;
        }
        const ComputeError& error = results[i].value.error();
        std::cout << "  " << Color::GRAY << "строка " << (i + 1) << Color::RESET << "  "
            << Color::YELLOW << toString(error.kind) << Color::RESET << "  "
            << error.describe() << "\n";
        ++reported;
    }
}

int run(const CommandLine& commandLine) {
    printHeader();

    auto lines = readExpressionLines(commandLine.input);
    std::filesystem::path reportPath = commandLine.output.value_or(defaultReportPath(commandLine.input));

    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << commandLine.input.string() << Color::RESET << "\n";
    std::cout << "  Отчет:         " << Color::YELLOW << reportPath.string() << Color::RESET << "\n";
    std::cout << "  Потоков:       " << Color::CYAN << commandLine.threadCount << Color::RESET << "\n";
    std::cout << "  Выражений:     " << Color::CYAN << lines.size() << Color::RESET << "\n\n";

    if (lines.empty()) {
        printWarning("входной файл пуст");
    }

    auto start = std::chrono::steady_clock::now();
    auto results = evaluateWithProgress(lines, commandLine);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    CsvWriter writer(reportPath);
    writer.write(results);

    BatchSummary summary = summarize(results);
    std::cout << "\n";
    printSuccess("Вычислено за " + std::to_string(elapsed.count()) + " мс");
    printInfo("Всего: " + std::to_string(summary.total) +
              ", успешно: " + std::to_string(summary.successful) +
              ", с ошибками: " + std::to_string(summary.failed));

    if (summary.failed > 0) {
        std::cout << "\n" << Color::BOLD << "Ошибки:\n" << Color::RESET;
        printErrors(results);
        if (summary.failed > kMaxReportedErrors) {
            printInfo("... и еще " + std::to_string(summary.failed - kMaxReportedErrors));
        }
    }

    std::cout << "\n";
    printSuccess("Отчет сохранен: " + reportPath.string());
    return summary.failed == 0 ? kExitSuccess : kExitHasErrors;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine commandLine;
    try {
        commandLine = parseCommandLine(argc, argv);
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        printUsage();
        return kExitUsage;
    }

    try {
        return run(commandLine);
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return kExitUsage;
    }
}
