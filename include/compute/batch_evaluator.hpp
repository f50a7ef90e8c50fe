#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "compute/error.hpp"
#include "compute/evaluator.hpp"
#include "compute/expression.hpp"
#include "compute/options.hpp"

namespace compute {

// Результат вычисления одного выражения пакета
struct EvaluationResult {
    std::string expression; // Исходный текст выражения, без изменений
    Result<double> value;   // Значение либо ошибка
};

// Сводка по пакету
struct BatchSummary {
    std::size_t total = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
};

// Пакетное вычисление.
// Каждый элемент вычисляется независимо: ошибка одного не влияет на остальные.
// Результат i всегда соответствует входу i, в том числе при параллельном вычислении.
class BatchEvaluator {
public:
    explicit BatchEvaluator(ExpressionEvaluator evaluator = {}, BatchOptions options = {})
        : evaluator(evaluator), options(options) {}

    std::vector<EvaluationResult> evaluate(const std::vector<Expression>& expressions) const;

    // Сырые строки оборачиваются без фильтрации: пустая строка дает запись
    // с ошибкой EmptyExpression, длина результата равна длине входа.
    std::vector<EvaluationResult> evaluate(const std::vector<std::string>& texts) const;

private:
    ExpressionEvaluator evaluator;
    BatchOptions options;

    EvaluationResult evaluateOne(const std::string& text) const;
    std::vector<EvaluationResult> run(const std::vector<std::string>& texts) const;
    std::vector<EvaluationResult> runParallel(const std::vector<std::string>& texts) const;
};

std::vector<EvaluationResult> evaluateBatch(const std::vector<Expression>& expressions);
std::vector<EvaluationResult> evaluateBatch(const std::vector<std::string>& texts);

BatchSummary summarize(const std::vector<EvaluationResult>& results);

} // namespace compute
