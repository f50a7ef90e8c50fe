#include "compute/tokenizer.hpp"

#include "compute/error.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace compute {

namespace {
// Пробельные символы грамматики: пробел, табуляция, перевод строки, возврат каретки
bool isBlank(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

// Печатное представление символа для сообщения об ошибке
std::string quoteChar(char ch) {
    auto code = static_cast<unsigned char>(ch);
    if (std::isprint(code)) {
        return std::string("'") + ch + "'";
    }
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "\\x%02X", code);
    return buffer;
}

// Значение литерала, который from_chars не смог представить в double:
// бесконечность при переполнении, ноль при потере значимости.
// Направление определяется по десятичному порядку литерала без полного разбора.
double outOfRangeValue(const std::string& text) {
    std::size_t exponentAt = text.find_first_of("eE");
    std::string mantissa = text.substr(0, exponentAt);

    std::size_t point = mantissa.find('.');
    std::string whole = mantissa.substr(0, point);
    std::string fraction = point == std::string::npos ? "" : mantissa.substr(point + 1);

    long long magnitude = 0;
    std::size_t firstSignificant = whole.find_first_not_of('0');
    if (firstSignificant != std::string::npos) {
        magnitude = static_cast<long long>(whole.size() - firstSignificant);
    } else {
        std::size_t leadingZeros = fraction.find_first_not_of('0');
        if (leadingZeros == std::string::npos) {
            return 0.0;
        }
        magnitude = -static_cast<long long>(leadingZeros);
    }

    if (exponentAt != std::string::npos) {
        const char* first = text.data() + exponentAt + 1;
        const char* last = text.data() + text.size();
        bool negative = first != last && *first == '-';
        if (first != last && (*first == '+' || *first == '-')) {
            ++first;
        }
        long long exponent = 0;
        auto [end, ec] = std::from_chars(first, last, exponent);
        if (ec == std::errc::result_out_of_range) {
            return negative ? 0.0 : HUGE_VAL;
        }
        magnitude += negative ? -exponent : exponent;
    }
    return magnitude > 0 ? HUGE_VAL : 0.0;
}
}

std::string describeToken(const Token& token) {
    if (token.type == TokenType::End) {
        return "конец выражения";
    }
    return "'" + token.text + "'";
}

Tokenizer::Tokenizer(std::string sourceText, ParserOptions options)
    : source(std::move(sourceText)), options(options) {}

// Основной цикл: проходит по строке и выделяет лексемы
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        char ch = peek();
        switch (ch) {
        case '+':
            tokens.push_back({TokenType::Plus, 0.0, "+", index});
            advance();
            break;
        case '-':
            tokens.push_back({TokenType::Minus, 0.0, "-", index});
            advance();
            break;
        case '*':
            tokens.push_back({TokenType::Star, 0.0, "*", index});
            advance();
            break;
        case '/':
            tokens.push_back({TokenType::Slash, 0.0, "/", index});
            advance();
            break;
        case '(':
            tokens.push_back({TokenType::LParen, 0.0, "(", index});
            advance();
            break;
        case ')':
            tokens.push_back({TokenType::RParen, 0.0, ")", index});
            advance();
            break;
        case '.':
            fail("число не может начинаться с десятичной точки", index);
        default:
            if (isDigit(ch)) {
                tokens.push_back(makeNumber());
            } else {
                fail("недопустимый символ " + quoteChar(ch), index);
            }
            break;
        }
    }

    tokens.push_back({TokenType::End, 0.0, "", index});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && isBlank(peek())) {
        advance();
    }
}

bool Tokenizer::consumeDigits() {
    std::size_t start = index;
    while (!isAtEnd() && isDigit(peek())) {
        advance();
    }
    return index > start;
}

// Разбор числового литерала.
// Знак в литерал не входит: отрицание строится парсером через унарный минус.
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    consumeDigits();

    if (!isAtEnd() && peek() == '.') {
        advance();
        if (!consumeDigits()) {
            fail("после десятичной точки ожидалась цифра", index);
        }
        if (!isAtEnd() && peek() == '.') {
            fail("лишняя десятичная точка в числе", index);
        }
    }

    if (options.allowScientificNotation && !isAtEnd() && (peek() == 'e' || peek() == 'E')) {
        advance();
        if (!isAtEnd() && (peek() == '+' || peek() == '-')) {
            advance();
        }
        if (!consumeDigits()) {
            fail("в показателе степени ожидалась цифра", index);
        }
    }

    std::string text = source.substr(start, index - start);

    // from_chars не зависит от локали; переполнение дает бесконечность, а не ошибку
    double value = 0.0;
    auto format = options.allowScientificNotation ? std::chars_format::general : std::chars_format::fixed;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value, format);
    if (ec == std::errc::invalid_argument || end != text.data() + text.size()) {
        throw ComputeException({ErrorKind::InvalidNumber,
                                "не удалось преобразовать '" + text + "'", start});
    }
    if (ec == std::errc::result_out_of_range) {
        value = outOfRangeValue(text);
    }
    return {TokenType::Number, value, text, start};
}

void Tokenizer::fail(const std::string& message, std::size_t position) const {
    throw ComputeException({ErrorKind::ParseError, message, position});
}

} // namespace compute
