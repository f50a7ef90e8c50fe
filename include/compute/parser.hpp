#pragma once

#include <memory>
#include <string>
#include <vector>

#include "compute/ast.hpp"
#include "compute/options.hpp"
#include "compute/token.hpp"

namespace compute {

// Синтаксический анализатор.
// Строит AST из списка лексем методом рекурсивного спуска:
//
//   expression     := additive
//   additive       := multiplicative ( ('+' | '-') multiplicative )*
//   multiplicative := unary ( ('*' | '/') unary )*
//   unary          := '-' unary | primary
//   primary        := number | '(' additive ')'
//
// Бинарные операции левоассоциативны: "a - b - c" разбирается как "(a - b) - c".
class Parser {
public:
    explicit Parser(std::vector<Token> tokens, ParserOptions options = {});

    // Возвращает корень AST для всего входа без остатка.
    // Выбрасывает ComputeException: EmptyExpression для пустого входа,
    // ParseError при нарушении грамматики.
    std::unique_ptr<AstNode> parse();

private:
    const std::vector<Token> tokens;
    const ParserOptions options;
    std::size_t current = 0; // Индекс текущей лексемы
    std::size_t depth = 0;   // Текущая глубина вложенности

    const Token& peek() const;
    const Token& previous() const;

    // Если текущая лексема нужного типа, сдвигается и возвращает true
    bool match(TokenType type);
    bool isAtEnd() const;

    // Методы рекурсивного спуска, от низкого приоритета к высокому
    std::unique_ptr<AstNode> parseAdditive();
    std::unique_ptr<AstNode> parseMultiplicative();
    std::unique_ptr<AstNode> parseUnary();
    std::unique_ptr<AstNode> parsePrimary();

    // Учет глубины вложенности; выбрасывает ParseError при превышении maxDepth
    void enterNested(std::size_t position);

    [[noreturn]] void fail(const std::string& message, std::size_t position) const;
};

} // namespace compute
