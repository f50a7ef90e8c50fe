#include "compute/expression.hpp"

#include <algorithm>

namespace compute {

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    });
}

std::optional<Expression> Expression::create(std::string raw) {
    if (isBlank(raw)) {
        return std::nullopt;
    }
    return Expression(std::move(raw));
}

std::ostream& operator<<(std::ostream& stream, const Expression& expression) {
    return stream << expression.text();
}

std::vector<Expression> makeExpressions(const std::vector<std::string>& rawTexts) {
    std::vector<Expression> expressions;
    expressions.reserve(rawTexts.size());
    for (const auto& raw : rawTexts) {
        if (auto expression = Expression::create(raw)) {
            expressions.push_back(std::move(*expression));
        }
    }
    return expressions;
}

} // namespace compute
