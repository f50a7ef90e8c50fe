#include "compute/error.hpp"

namespace compute {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::EmptyExpression:
        return "empty_expression";
    case ErrorKind::ParseError:
        return "parse_error";
    case ErrorKind::InvalidNumber:
        return "invalid_number";
    case ErrorKind::DivisionByZero:
        return "division_by_zero";
    case ErrorKind::InvalidStructure:
        return "invalid_structure";
    }
    return "unknown";
}

namespace {
// Заголовок сообщения для каждого вида ошибки
const char* headline(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::EmptyExpression:
        return "Пустое выражение";
    case ErrorKind::ParseError:
        return "Синтаксическая ошибка";
    case ErrorKind::InvalidNumber:
        return "Некорректное число";
    case ErrorKind::DivisionByZero:
        return "Деление на ноль";
    case ErrorKind::InvalidStructure:
        return "Некорректная структура дерева";
    }
    return "Неизвестная ошибка";
}
}

// Формат: "<заголовок>: <сообщение> (позиция N)"
std::string ComputeError::describe() const {
    std::string text = headline(kind);
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    if (position.has_value()) {
        text += " (позиция " + std::to_string(*position) + ")";
    }
    return text;
}

ComputeException::ComputeException(ComputeError error)
    : std::runtime_error(error.describe()), err(std::move(error)) {}

} // namespace compute
