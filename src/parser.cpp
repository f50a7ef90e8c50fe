#include "compute/parser.hpp"

#include "compute/error.hpp"

namespace compute {

namespace {
// Гарантирует, что список лексем заканчивается End
std::vector<Token> withEndToken(std::vector<Token> tokens) {
    if (tokens.empty() || tokens.back().type != TokenType::End) {
        std::size_t position = tokens.empty() ? 0 : tokens.back().position + tokens.back().text.size();
        tokens.push_back({TokenType::End, 0.0, "", position});
    }
    return tokens;
}

// Снимает уровень вложенности при выходе из области видимости, в том числе по исключению
class NestingScope {
public:
    explicit NestingScope(std::size_t& depth) : depth(depth) {}
    ~NestingScope() { --depth; }

    NestingScope(const NestingScope&) = delete;
    NestingScope& operator=(const NestingScope&) = delete;

private:
    std::size_t& depth;
};
}

Parser::Parser(std::vector<Token> tokens, ParserOptions options)
    : tokens(withEndToken(std::move(tokens))), options(options) {}

// Запуск разбора. Выражение должно быть разобрано целиком.
std::unique_ptr<AstNode> Parser::parse() {
    if (isAtEnd()) {
        throw ComputeException({ErrorKind::EmptyExpression, "выражение не содержит лексем",
                                peek().position});
    }

    auto root = parseAdditive();
    if (!isAtEnd()) {
        const Token& token = peek();
        if (token.type == TokenType::RParen) {
            fail("лишняя закрывающая скобка", token.position);
        }
        fail("ожидался оператор перед " + describeToken(token), token.position);
    }
    return root;
}

const Token& Parser::peek() const {
    return tokens[current];
}

const Token& Parser::previous() const {
    return tokens[current - 1];
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && peek().type == type) {
        ++current;
        return true;
    }
    return false;
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

// additive := multiplicative ( ('+' | '-') multiplicative )*
std::unique_ptr<AstNode> Parser::parseAdditive() {
    auto node = parseMultiplicative();
    while (true) {
        if (match(TokenType::Plus)) {
            auto right = parseMultiplicative();
            node = std::make_unique<BinaryNode>(NodeKind::Add, std::move(node), std::move(right));
        } else if (match(TokenType::Minus)) {
            auto right = parseMultiplicative();
            node = std::make_unique<BinaryNode>(NodeKind::Sub, std::move(node), std::move(right));
        } else {
            break;
        }
    }
    return node;
}

// multiplicative := unary ( ('*' | '/') unary )*
std::unique_ptr<AstNode> Parser::parseMultiplicative() {
    auto node = parseUnary();
    while (true) {
        if (match(TokenType::Star)) {
            auto right = parseUnary();
            node = std::make_unique<BinaryNode>(NodeKind::Mul, std::move(node), std::move(right));
        } else if (match(TokenType::Slash)) {
            auto right = parseUnary();
            node = std::make_unique<BinaryNode>(NodeKind::Div, std::move(node), std::move(right));
        } else {
            break;
        }
    }
    return node;
}

// unary := '-' unary | primary
// Каждый минус дает отдельный узел Neg: "--5" -> Neg(Neg(5))
std::unique_ptr<AstNode> Parser::parseUnary() {
    if (match(TokenType::Minus)) {
        enterNested(previous().position);
        NestingScope scope(depth);
        return std::make_unique<NegateNode>(parseUnary());
    }
    return parsePrimary();
}

// primary := number | '(' additive ')'
std::unique_ptr<AstNode> Parser::parsePrimary() {
    if (match(TokenType::Number)) {
        return std::make_unique<NumberNode>(previous().numericValue);
    }

    if (match(TokenType::LParen)) {
        std::size_t openPosition = previous().position;
        enterNested(openPosition);
        NestingScope scope(depth);

        auto node = parseAdditive();
        if (!match(TokenType::RParen)) {
            if (isAtEnd()) {
                fail("не закрыта скобка, открытая на позиции " + std::to_string(openPosition),
                     peek().position);
            }
            fail("ожидалась ')' вместо " + describeToken(peek()), peek().position);
        }
        return node;
    }

    const Token& token = peek();
    switch (token.type) {
    case TokenType::End:
        fail("неожиданный конец выражения: ожидался операнд", token.position);
    case TokenType::RParen:
        fail("ожидался операнд перед ')'", token.position);
    default:
        fail("ожидалось число или '(' вместо " + describeToken(token), token.position);
    }
}

void Parser::enterNested(std::size_t position) {
    if (depth >= options.maxDepth) {
        fail("превышена допустимая глубина вложенности (" + std::to_string(options.maxDepth) + ")",
             position);
    }
    ++depth;
}

void Parser::fail(const std::string& message, std::size_t position) const {
    throw ComputeException({ErrorKind::ParseError, message, position});
}

} // namespace compute
