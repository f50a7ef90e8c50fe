#pragma once

#include <memory>
#include <string>

#include "compute/ast.hpp"
#include "compute/error.hpp"
#include "compute/expression.hpp"
#include "compute/options.hpp"

namespace compute {

// Фасад для вычисления арифметических выражений.
// Объединяет токенизацию, разбор и вычисление AST. Ошибки возвращаются значением
// (Result), исключения наружу не выходят. Не хранит состояния между вызовами.
class ExpressionEvaluator {
public:
    ExpressionEvaluator() = default;
    explicit ExpressionEvaluator(ParserOptions options) : parserOptions(options) {}

    // Вычисляет выражение, заданное строкой. Пример: "2 + 2 * 2" -> 6.0
    // Пустая или пробельная строка дает ошибку EmptyExpression (а не "нет значения").
    Result<double> evaluate(const std::string& text) const;
    Result<double> evaluate(const Expression& expression) const;

    // Вычисляет готовое дерево
    Result<double> evaluate(const AstNode& root) const;

    // Только разбор: строит AST без вычисления
    Result<std::unique_ptr<AstNode>> parse(const std::string& text) const;
    Result<std::unique_ptr<AstNode>> parse(const Expression& expression) const;

    const ParserOptions& options() const { return parserOptions; }

private:
    ParserOptions parserOptions;

    // Токенизация и разбор; выбрасывает ComputeException
    std::unique_ptr<AstNode> buildTree(const std::string& text) const;
};

// Вычисление с настройками по умолчанию
Result<double> evaluate(const std::string& text);

// Разбор с настройками по умолчанию
Result<std::unique_ptr<AstNode>> parseExpression(const Expression& expression);

} // namespace compute
