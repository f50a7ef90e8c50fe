#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace compute {

// true, если строка пуста или состоит только из пробельных символов
bool isBlank(std::string_view text);

// Непустое выражение: исходный текст хранится без изменений (пробелы сохраняются).
// Неизменяемо после создания и не хранит результатов разбора.
class Expression {
public:
    // Возвращает std::nullopt для пустой или пробельной строки, это не ошибка.
    static std::optional<Expression> create(std::string raw);

    const std::string& text() const { return source; }

    bool operator==(const Expression& other) const = default;

private:
    explicit Expression(std::string raw) : source(std::move(raw)) {}

    std::string source;
};

std::ostream& operator<<(std::ostream& stream, const Expression& expression);

// Построение пакета из сырых строк: пустые и пробельные строки отбрасываются
std::vector<Expression> makeExpressions(const std::vector<std::string>& rawTexts);

} // namespace compute
