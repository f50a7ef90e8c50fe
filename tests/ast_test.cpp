#include <gtest/gtest.h>

#include <cfloat>
#include <cmath>
#include <memory>
#include <string>

#include "compute/ast.hpp"
#include "compute/error.hpp"
#include "compute/evaluator.hpp"

using namespace compute;

namespace {

std::string canonical(const std::string& text) {
    auto tree = ExpressionEvaluator().parse(text);
    if (!tree) {
        return "<" + tree.error().describe() + ">";
    }
    return tree.value()->toString();
}

std::unique_ptr<AstNode> number(double value) {
    return std::make_unique<NumberNode>(value);
}

std::unique_ptr<AstNode> binary(NodeKind kind, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right) {
    return std::make_unique<BinaryNode>(kind, std::move(left), std::move(right));
}

}

TEST(AstTest, NodeKinds) {
    EXPECT_EQ(number(1)->kind(), NodeKind::Number);
    EXPECT_EQ(binary(NodeKind::Add, number(1), number(2))->kind(), NodeKind::Add);
    EXPECT_EQ(binary(NodeKind::Div, number(1), number(2))->kind(), NodeKind::Div);
    EXPECT_EQ(NegateNode(number(1)).kind(), NodeKind::Neg);
}

TEST(AstTest, OperatorSymbols) {
    EXPECT_EQ(operatorSymbol(NodeKind::Add), '+');
    EXPECT_EQ(operatorSymbol(NodeKind::Sub), '-');
    EXPECT_EQ(operatorSymbol(NodeKind::Mul), '*');
    EXPECT_EQ(operatorSymbol(NodeKind::Div), '/');
    EXPECT_EQ(operatorSymbol(NodeKind::Neg), '-');
    EXPECT_EQ(operatorSymbol(NodeKind::Number), '\0');
}

TEST(AstTest, EvaluatesHandBuiltTree) {
    // (7 - 2) * -(3 / 4)
    auto tree = binary(NodeKind::Mul,
                       binary(NodeKind::Sub, number(7), number(2)),
                       std::make_unique<NegateNode>(binary(NodeKind::Div, number(3), number(4))));
    EXPECT_DOUBLE_EQ(tree->evaluate(), -3.75);
    EXPECT_EQ(tree->toString(), "((7 - 2) * -(3 / 4))");
}

TEST(AstTest, PrettyPrinterParenthesisesBinaryNodes) {
    EXPECT_EQ(canonical("42"), "42");
    EXPECT_EQ(canonical("2 + 3"), "(2 + 3)");
    EXPECT_EQ(canonical("10 - 4"), "(10 - 4)");
    EXPECT_EQ(canonical("3 * 4"), "(3 * 4)");
    EXPECT_EQ(canonical("15 / 3"), "(15 / 3)");
    EXPECT_EQ(canonical("2 + 3 * 4"), "(2 + (3 * 4))");
    EXPECT_EQ(canonical("(2 + 3) * 4"), "((2 + 3) * 4)");
    EXPECT_EQ(canonical("2 * 3 + 4 * 5"), "((2 * 3) + (4 * 5))");
    EXPECT_EQ(canonical("((2 + 3) * 4 - 5) / 6"), "((((2 + 3) * 4) - 5) / 6)");
}

TEST(AstTest, PrettyPrinterFlattensLeftChainsOfSamePrecedence) {
    EXPECT_EQ(canonical("1 + 2 + 3"), "(1 + 2 + 3)");
    EXPECT_EQ(canonical("10 - 5 - 2"), "(10 - 5 - 2)");
    EXPECT_EQ(canonical("8 / 4 * 2"), "(8 / 4 * 2)");
    EXPECT_EQ(canonical("1 - (2 - 3)"), "(1 - (2 - 3))");
    EXPECT_EQ(canonical("1 * 2 + 3"), "((1 * 2) + 3)");
    EXPECT_EQ(canonical("-(1 + 2 + 3)"), "-(1 + 2 + 3)");

    // Повторный разбор печатной формы дает то же значение
    for (const char* text : {"10 - 5 - 2", "8 / 4 * 2", "1 - (2 - 3)", "20 / 4 / 2 - 1 - 1"}) {
        EXPECT_EQ(ExpressionEvaluator().evaluate(canonical(text)).value(),
                  ExpressionEvaluator().evaluate(std::string(text)).value())
            << text;
    }
}

TEST(AstTest, LongFlatChainDoesNotExhaustStack) {
    const std::size_t terms = 1000000;
    std::string text = "1";
    text.reserve(terms * 2);
    for (std::size_t i = 1; i < terms; ++i) {
        text += "+1";
    }

    ExpressionEvaluator evaluator;
    auto value = evaluator.evaluate(text);
    ASSERT_TRUE(value.ok()) << value.error().describe();
    EXPECT_EQ(value.value(), static_cast<double>(terms));

    auto tree = evaluator.parse(text);
    ASSERT_TRUE(tree.ok());
    std::string printed = tree.value()->toString();
    EXPECT_EQ(printed.substr(0, 10), "(1 + 1 + 1");

    // Печатная форма разбирается повторно, не упираясь в ограничение вложенности
    auto reparsed = evaluator.evaluate(printed);
    ASSERT_TRUE(reparsed.ok()) << reparsed.error().describe();
    EXPECT_EQ(reparsed.value(), static_cast<double>(terms));
}

TEST(AstTest, DeepHandBuiltTreeEvaluatesPrintsAndDestroys) {
    const std::size_t depth = 1000000;
    std::unique_ptr<AstNode> negations = number(2);
    std::unique_ptr<AstNode> chain = number(0);
    for (std::size_t i = 0; i < depth; ++i) {
        negations = std::make_unique<NegateNode>(std::move(negations));
        chain = binary(NodeKind::Sub, std::move(chain), number(1));
    }

    EXPECT_EQ(negations->evaluate(), 2.0);
    EXPECT_EQ(negations->toString().size(), depth + 1);
    EXPECT_EQ(chain->evaluate(), -static_cast<double>(depth));

    negations.reset();
    chain.reset();
    EXPECT_FALSE(negations);
    EXPECT_FALSE(chain);
}

TEST(AstTest, InfinityPrintsAsOverflowingLiteral) {
    std::string overflow = "1" + std::string(309, '0');
    EXPECT_EQ(number(HUGE_VAL)->toString(), overflow);
    EXPECT_EQ(number(-HUGE_VAL)->toString(), "-" + overflow);
    EXPECT_EQ(std::make_unique<NegateNode>(number(HUGE_VAL))->toString(), "-" + overflow);

    auto tree = ExpressionEvaluator().parse("1" + std::string(400, '0'));
    ASSERT_TRUE(tree.ok());
    EXPECT_EQ(tree.value()->toString(), overflow);

    auto reparsed = evaluate(tree.value()->toString());
    ASSERT_TRUE(reparsed.ok());
    EXPECT_TRUE(std::isinf(reparsed.value()));
    EXPECT_GT(reparsed.value(), 0.0);

    auto negated = evaluate(number(-HUGE_VAL)->toString());
    ASSERT_TRUE(negated.ok());
    EXPECT_EQ(negated.value(), -HUGE_VAL);
}

TEST(AstTest, PrettyPrinterNegation) {
    EXPECT_EQ(canonical("-5"), "-5");
    EXPECT_EQ(canonical("-(2 + 3)"), "-(2 + 3)");
    EXPECT_EQ(canonical("-(-5)"), "--5");
    EXPECT_EQ(canonical("--5"), "--5");
}

TEST(AstTest, PrettyPrinterNumberFormatting) {
    EXPECT_EQ(canonical("42.0"), "42");
    EXPECT_EQ(canonical("3.14"), "3.14");
    EXPECT_EQ(canonical("3.14159"), "3.14159");
    EXPECT_EQ(canonical("0.00001"), "0.00001");
    EXPECT_EQ(canonical("-42.0"), "-42");
    EXPECT_EQ(canonical("-3.14"), "-3.14");
    EXPECT_EQ(canonical("007"), "7");
}

TEST(AstTest, FormatNumberNeverUsesExponent) {
    EXPECT_EQ(formatNumber(1e21), "1000000000000000000000");
    EXPECT_EQ(formatNumber(1e-7), "0.0000001");
    EXPECT_EQ(formatNumber(-2.5), "-2.5");
    EXPECT_EQ(formatNumber(0.1 + 0.2), "0.30000000000000004");

    std::string largest = formatNumber(DBL_MAX);
    EXPECT_EQ(largest.find('e'), std::string::npos);
    EXPECT_EQ(largest.size(), 309u);
}

TEST(AstTest, DivisionByExactZeroIsReported) {
    auto positive = binary(NodeKind::Div, number(1), number(0.0));
    auto negative = binary(NodeKind::Div, number(1), number(-0.0));

    for (const auto* tree : {positive.get(), negative.get()}) {
        try {
            tree->evaluate();
            FAIL() << "ожидалось деление на ноль";
        }
        catch (const ComputeException& ex) {
            EXPECT_EQ(ex.kind(), ErrorKind::DivisionByZero);
        }
    }
}

TEST(AstTest, DivisionByTinyNumberIsNotAnError) {
    auto tree = binary(NodeKind::Div, number(1), number(DBL_MIN));
    EXPECT_GT(tree->evaluate(), 1e300);
}

TEST(AstTest, MissingChildIsInvalidStructure) {
    ExpressionEvaluator evaluator;

    BinaryNode missingRight(NodeKind::Add, number(1), nullptr);
    auto result = evaluator.evaluate(missingRight);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidStructure);
    EXPECT_EQ(missingRight.toString(), "(1 + ?)");

    NegateNode missingOperand(nullptr);
    EXPECT_EQ(evaluator.evaluate(missingOperand).errorKind(), ErrorKind::InvalidStructure);
}

TEST(AstTest, NonBinaryKindInBinaryNodeIsInvalidStructure) {
    BinaryNode wrongKind(NodeKind::Neg, number(1), number(2));
    auto result = ExpressionEvaluator().evaluate(wrongKind);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidStructure);
}
