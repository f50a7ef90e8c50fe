#pragma once

#include <cstddef>
#include <string>

namespace compute {

// Типы лексем грамматики
enum class TokenType {
    Number, // Числовой литерал
    Plus,   // +
    Minus,  // -
    Star,   // *
    Slash,  // /
    LParen, // (
    RParen, // )
    End     // Конец входной строки
};

// Лексема: тип, числовое значение (для Number), исходный текст и позиция
struct Token {
    TokenType type;
    double numericValue;
    std::string text;
    std::size_t position;
};

// Текстовое представление лексемы для сообщений об ошибках
std::string describeToken(const Token& token);

} // namespace compute
