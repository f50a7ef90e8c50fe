#include "compute/batch_evaluator.hpp"

#include "compute/thread_pool.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace compute {

std::vector<EvaluationResult> BatchEvaluator::evaluate(const std::vector<Expression>& expressions) const {
    std::vector<std::string> texts;
    texts.reserve(expressions.size());
    for (const auto& expression : expressions) {
        texts.push_back(expression.text());
    }
    return run(texts);
}

std::vector<EvaluationResult> BatchEvaluator::evaluate(const std::vector<std::string>& texts) const {
    return run(texts);
}

EvaluationResult BatchEvaluator::evaluateOne(const std::string& text) const {
    EvaluationResult result{text, evaluator.evaluate(text)};
    if (options.progress != nullptr) {
        options.progress->fetch_add(1);
    }
    return result;
}

std::vector<EvaluationResult> BatchEvaluator::run(const std::vector<std::string>& texts) const {
    if (options.threadCount > 1 && texts.size() > 1) {
        return runParallel(texts);
    }

    std::vector<EvaluationResult> results;
    results.reserve(texts.size());
    for (const auto& text : texts) {
        results.push_back(evaluateOne(text));
    }
    return results;
}

// Поток пишет результат входа i в ячейку i заранее выделенного вектора,
// поэтому порядок результатов не зависит от порядка завершения потоков
std::vector<EvaluationResult> BatchEvaluator::runParallel(const std::vector<std::string>& texts) const {
    ThreadPool pool(std::min(options.threadCount, texts.size()));

    std::vector<std::optional<EvaluationResult>> slots(texts.size());
    pool.forEachIndex(texts.size(), [this, &texts, &slots](std::size_t index) {
        slots[index].emplace(evaluateOne(texts[index]));
    });

    std::vector<EvaluationResult> results;
    results.reserve(texts.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

std::vector<EvaluationResult> evaluateBatch(const std::vector<Expression>& expressions) {
    return BatchEvaluator().evaluate(expressions);
}

std::vector<EvaluationResult> evaluateBatch(const std::vector<std::string>& texts) {
    return BatchEvaluator().evaluate(texts);
}

BatchSummary summarize(const std::vector<EvaluationResult>& results) {
    BatchSummary summary;
    summary.total = results.size();
    for (const auto& result : results) {
        if (result.value.ok()) {
            ++summary.successful;
        } else {
            ++summary.failed;
        }
    }
    return summary;
}

} // namespace compute
