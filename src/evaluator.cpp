#include "compute/evaluator.hpp"

#include "compute/parser.hpp"
#include "compute/tokenizer.hpp"

namespace compute {

// Полный цикл обработки выражения:
// 1. Проверка на пустоту (до разбора)
// 2. Токенизация и разбор -> AST
// 3. Вычисление AST
Result<double> ExpressionEvaluator::evaluate(const std::string& text) const {
    try {
        auto root = buildTree(text);
        return root->evaluate();
    }
    catch (const ComputeException& ex) {
        return ex.error();
    }
}

Result<double> ExpressionEvaluator::evaluate(const Expression& expression) const {
    return evaluate(expression.text());
}

Result<double> ExpressionEvaluator::evaluate(const AstNode& root) const {
    try {
        return root.evaluate();
    }
    catch (const ComputeException& ex) {
        return ex.error();
    }
}

Result<std::unique_ptr<AstNode>> ExpressionEvaluator::parse(const std::string& text) const {
    try {
        return buildTree(text);
    }
    catch (const ComputeException& ex) {
        return ex.error();
    }
}

Result<std::unique_ptr<AstNode>> ExpressionEvaluator::parse(const Expression& expression) const {
    return parse(expression.text());
}

std::unique_ptr<AstNode> ExpressionEvaluator::buildTree(const std::string& text) const {
    if (isBlank(text)) {
        throw ComputeException({ErrorKind::EmptyExpression, "строка пуста или содержит только пробелы"});
    }

    // Этап 1: лексический анализ
    Tokenizer tokenizer(text, parserOptions);
    auto tokens = tokenizer.tokenize();

    // Этап 2: синтаксический анализ
    Parser parser(std::move(tokens), parserOptions);
    return parser.parse();
}

Result<double> evaluate(const std::string& text) {
    return ExpressionEvaluator().evaluate(text);
}

Result<std::unique_ptr<AstNode>> parseExpression(const Expression& expression) {
    return ExpressionEvaluator().parse(expression);
}

} // namespace compute
