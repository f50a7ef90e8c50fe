#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "compute/ast.hpp"
#include "compute/error.hpp"
#include "compute/parser.hpp"
#include "compute/tokenizer.hpp"

using namespace compute;

namespace {

std::unique_ptr<AstNode> parseText(const std::string& text, ParserOptions options = {}) {
    Tokenizer tokenizer(text, options);
    Parser parser(tokenizer.tokenize(), options);
    return parser.parse();
}

std::optional<ComputeError> parseError(const std::string& text, ParserOptions options = {}) {
    try {
        parseText(text, options);
    }
    catch (const ComputeException& ex) {
        return ex.error();
    }
    return std::nullopt;
}

const BinaryNode& asBinary(const AstNode* node) {
    auto binary = dynamic_cast<const BinaryNode*>(node);
    if (binary == nullptr) {
        throw std::runtime_error("узел не является бинарным");
    }
    return *binary;
}

double numberValue(const AstNode* node) {
    auto number = dynamic_cast<const NumberNode*>(node);
    if (number == nullptr) {
        throw std::runtime_error("узел не является числом");
    }
    return number->value();
}

ParserOptions withDepth(std::size_t maxDepth) {
    ParserOptions options;
    options.maxDepth = maxDepth;
    return options;
}

}

TEST(ParserTest, SubtractionIsLeftAssociative) {
    auto root = parseText("10 - 5 - 2");
    ASSERT_EQ(root->kind(), NodeKind::Sub);
    const auto& outer = asBinary(root.get());
    EXPECT_EQ(numberValue(outer.right()), 2.0);

    ASSERT_EQ(outer.left()->kind(), NodeKind::Sub);
    const auto& inner = asBinary(outer.left());
    EXPECT_EQ(numberValue(inner.left()), 10.0);
    EXPECT_EQ(numberValue(inner.right()), 5.0);
}

TEST(ParserTest, DivisionIsLeftAssociative) {
    auto root = parseText("20 / 4 / 2");
    ASSERT_EQ(root->kind(), NodeKind::Div);
    const auto& outer = asBinary(root.get());
    EXPECT_EQ(outer.left()->kind(), NodeKind::Div);
    EXPECT_EQ(outer.right()->kind(), NodeKind::Number);
    EXPECT_EQ(root->toString(), "(20 / 4 / 2)");
}

TEST(ParserTest, MixedAdditiveChainIsLeftAssociative) {
    auto root = parseText("1 + 2 - 3 + 4");
    EXPECT_EQ(root->toString(), "(1 + 2 - 3 + 4)");
}

TEST(ParserTest, MultiplicationBindsTighterThanAddition) {
    auto root = parseText("2 + 3 * 4");
    ASSERT_EQ(root->kind(), NodeKind::Add);
    const auto& add = asBinary(root.get());
    EXPECT_EQ(numberValue(add.left()), 2.0);
    ASSERT_EQ(add.right()->kind(), NodeKind::Mul);
    const auto& mul = asBinary(add.right());
    EXPECT_EQ(numberValue(mul.left()), 3.0);
    EXPECT_EQ(numberValue(mul.right()), 4.0);
}

TEST(ParserTest, ParenthesesResetPrecedence) {
    auto root = parseText("(2 + 3) * 4");
    ASSERT_EQ(root->kind(), NodeKind::Mul);
    EXPECT_EQ(asBinary(root.get()).left()->kind(), NodeKind::Add);

    EXPECT_EQ(parseText("((2 + 3) * (4 - 1)) / 5")->toString(), "((2 + 3) * (4 - 1) / 5)");
}

TEST(ParserTest, UnaryMinusStacks) {
    auto root = parseText("---5");
    const AstNode* node = root.get();
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(node->kind(), NodeKind::Neg);
        node = static_cast<const NegateNode*>(node)->operand();
    }
    EXPECT_EQ(numberValue(node), 5.0);
}

TEST(ParserTest, UnaryMinusBindsTighterThanMultiplication) {
    EXPECT_EQ(parseText("-2 * 3")->toString(), "(-2 * 3)");
    EXPECT_EQ(parseText("5 * - 2")->toString(), "(5 * -2)");
    EXPECT_EQ(parseText("1 - - 2")->toString(), "(1 - -2)");
    EXPECT_EQ(parseText("-(2 + 3)")->kind(), NodeKind::Neg);
}

TEST(ParserTest, RejectsGrammarViolations) {
    const char* invalid[] = {
        "2 +", "+ 3", "2 * ", "/ 5", "2 + * 3", "* 2 + 3", "+",
        "1 ++ 2", "1 */ 2", "2 ** 3", "2 // 3",
        "(2 + 3", "2 + 3)", "((2 + 3)", "(2 + 3))", "2 + (3 + )", "()", "( )", "1 + ()",
        "1 2", "(1)(2)", "2 (3)", "(", ")",
    };
    for (const char* text : invalid) {
        auto error = parseError(text);
        ASSERT_TRUE(error.has_value()) << text;
        EXPECT_EQ(error->kind, ErrorKind::ParseError) << text;
        EXPECT_TRUE(error->position.has_value()) << text;
    }
}

TEST(ParserTest, UnclosedParenthesisReportsOpeningPosition) {
    auto error = parseError("(1 + 2");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->position, 6u);
    EXPECT_NE(error->message.find("0"), std::string::npos);
}

TEST(ParserTest, StrayClosingParenthesisPosition) {
    auto error = parseError("1 + 2)");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ParseError);
    EXPECT_EQ(error->position, 5u);
}

TEST(ParserTest, MissingOperandBeforeEnd) {
    auto error = parseError("2 +   ");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->position, 6u);
}

TEST(ParserTest, EmptyTokenStreamIsEmptyExpression) {
    Parser parser(std::vector<Token>{});
    try {
        parser.parse();
        FAIL() << "ожидалось исключение";
    }
    catch (const ComputeException& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::EmptyExpression);
    }
}

TEST(ParserTest, NestingWithinLimitIsAccepted) {
    std::string text = std::string(10, '(') + "1" + std::string(10, ')');
    EXPECT_NO_THROW(parseText(text, withDepth(10)));
    EXPECT_NO_THROW(parseText(std::string(10, '-') + "1", withDepth(10)));
}

TEST(ParserTest, NestingBeyondLimitIsParseError) {
    std::string parens = std::string(11, '(') + "1" + std::string(11, ')');
    auto error = parseError(parens, withDepth(10));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ParseError);
    EXPECT_EQ(error->position, 10u);

    auto minuses = parseError(std::string(11, '-') + "1", withDepth(10));
    ASSERT_TRUE(minuses.has_value());
    EXPECT_EQ(minuses->kind, ErrorKind::ParseError);
}

TEST(ParserTest, DefaultLimitAllowsHundredLevels) {
    std::string text = std::string(100, '(') + "1" + std::string(100, ')');
    auto root = parseText(text);
    EXPECT_EQ(root->kind(), NodeKind::Number);
}

TEST(ParserTest, HostileNestingDoesNotOverflowStack) {
    auto error = parseError(std::string(100000, '('));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ParseError);

    auto minuses = parseError(std::string(100000, '-') + "1");
    ASSERT_TRUE(minuses.has_value());
    EXPECT_EQ(minuses->kind, ErrorKind::ParseError);
}
