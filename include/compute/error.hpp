#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace compute {

// Закрытый перечень видов ошибок вычисления
enum class ErrorKind {
    EmptyExpression,  // Пустая строка или только пробелы
    ParseError,       // Нарушение грамматики
    InvalidNumber,    // Литерал не удалось преобразовать в double
    DivisionByZero,   // Делитель равен точно нулю
    InvalidStructure  // Внутренне противоречивое дерево (дефект парсера)
};

// Машиночитаемое имя вида ошибки: "parse_error", "division_by_zero" и т.д.
const char* toString(ErrorKind kind);

// Ошибка как значение: вид, сообщение и (если известна) позиция в исходной строке
struct ComputeError {
    ErrorKind kind;
    std::string message;
    std::optional<std::size_t> position;

    ComputeError(ErrorKind kind, std::string message,
                 std::optional<std::size_t> position = std::nullopt)
        : kind(kind), message(std::move(message)), position(position) {}

    // Человекочитаемое описание: вид, текст и позиция
    std::string describe() const;

    bool operator==(const ComputeError& other) const = default;
};

// Исключение, которым ошибка поднимается сквозь рекурсивный разбор и вычисление.
// Наружу из публичного API не выходит: фасад превращает его в Result.
class ComputeException : public std::runtime_error {
public:
    explicit ComputeException(ComputeError error);

    const ComputeError& error() const noexcept { return err; }
    ErrorKind kind() const noexcept { return err.kind; }

private:
    ComputeError err;
};

// Результат операции: значение типа T либо ComputeError.
// Допускает move-only значения (например, std::unique_ptr на корень AST).
template <class T>
class Result {
public:
    Result(T value) : data(std::in_place_index<0>, std::move(value)) {}
    Result(ComputeError error) : data(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return data.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    // Доступ к значению. При ошибке выбрасывает ComputeException.
    T& value() & {
        check();
        return std::get<0>(data);
    }
    const T& value() const& {
        check();
        return std::get<0>(data);
    }
    T&& value() && {
        check();
        return std::get<0>(std::move(data));
    }

    // Доступ к ошибке. Вызывать только если ok() == false.
    const ComputeError& error() const {
        if (ok()) {
            throw std::logic_error("Результат не содержит ошибки");
        }
        return std::get<1>(data);
    }

    // Вид ошибки либо std::nullopt для успешного результата
    std::optional<ErrorKind> errorKind() const noexcept {
        if (ok()) {
            return std::nullopt;
        }
        return std::get<1>(data).kind;
    }

private:
    std::variant<T, ComputeError> data;

    void check() const {
        if (!ok()) {
            throw ComputeException(std::get<1>(data));
        }
    }
};

} // namespace compute
