#pragma once

#include <string>
#include <vector>

#include "compute/options.hpp"
#include "compute/token.hpp"

namespace compute {

// Лексический анализатор.
// Преобразует строку выражения в последовательность лексем, пропуская пробелы,
// табуляции и переводы строк между ними.
class Tokenizer {
public:
    explicit Tokenizer(std::string sourceText, ParserOptions options = {});

    // Возвращает вектор лексем, заканчивающийся лексемой End.
    // Выбрасывает ComputeException (ParseError) на недопустимом символе или
    // неправильной форме числа, (InvalidNumber) если литерал не преобразуется в double.
    std::vector<Token> tokenize();

private:
    const std::string source;
    const ParserOptions options;
    std::size_t index = 0; // Текущая позиция чтения

    bool isAtEnd() const;
    char peek() const;
    char advance();
    void skipWhitespace();

    // Считывает digit+ ('.' digit+)? и, если разрешено, экспоненту
    Token makeNumber();

    // Считывает одну или более цифр; возвращает false, если цифр нет
    bool consumeDigits();

    [[noreturn]] void fail(const std::string& message, std::size_t position) const;
};

} // namespace compute
