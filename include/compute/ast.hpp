#pragma once

#include <memory>
#include <string>
#include <vector>

namespace compute {

// Вид узла дерева. Других видов в дереве не бывает.
enum class NodeKind {
    Number,
    Add,
    Sub,
    Mul,
    Div,
    Neg
};

// Символ операции для бинарных видов ('+', '-', '*', '/'), '-' для Neg, '\0' для Number
char operatorSymbol(NodeKind kind);

// Базовый класс узла абстрактного синтаксического дерева (AST).
// Дочерние узлы принадлежат родителю монопольно: дерево без общих узлов и циклов.
class AstNode {
public:
    virtual ~AstNode() = default;

    virtual NodeKind kind() const = 0;

    // Вычисляет значение поддерева. Обход идет по явному стеку, поэтому глубина
    // дерева ограничена только памятью.
    // Выбрасывает ComputeException (DivisionByZero, InvalidStructure).
    virtual double evaluate() const = 0;

    // Каноническая запись с полной расстановкой скобок: "(2 + (3 * 4))"
    virtual std::string toString() const = 0;

protected:
    // Передает владение дочерними узлами в pending
    virtual void releaseChildren(std::vector<std::unique_ptr<AstNode>>& pending) {
        (void)pending;
    }

    // Разрушение поддеревьев без рекурсии: высота дерева из длинной цепочки
    // "1 + 1 + ... + 1" равна числу слагаемых
    static void destroyAll(std::vector<std::unique_ptr<AstNode>> pending);
};

// Числовая константа (лист дерева)
class NumberNode final : public AstNode {
public:
    explicit NumberNode(double value) : number(value) {}

    NodeKind kind() const override { return NodeKind::Number; }
    double evaluate() const override { return number; }
    std::string toString() const override;

    double value() const { return number; }

private:
    double number;
};

// Бинарная арифметическая операция: Add, Sub, Mul или Div
class BinaryNode final : public AstNode {
public:
    BinaryNode(NodeKind op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right)
        : op(op), lhs(std::move(left)), rhs(std::move(right)) {}
    ~BinaryNode() override;

    NodeKind kind() const override { return op; }
    double evaluate() const override;
    std::string toString() const override;

    const AstNode* left() const { return lhs.get(); }
    const AstNode* right() const { return rhs.get(); }

protected:
    void releaseChildren(std::vector<std::unique_ptr<AstNode>>& pending) override;

private:
    NodeKind op;
    std::unique_ptr<AstNode> lhs; // Левый операнд
    std::unique_ptr<AstNode> rhs; // Правый операнд
};

// Унарный минус
class NegateNode final : public AstNode {
public:
    explicit NegateNode(std::unique_ptr<AstNode> operand) : child(std::move(operand)) {}
    ~NegateNode() override;

    NodeKind kind() const override { return NodeKind::Neg; }
    double evaluate() const override;
    std::string toString() const override;

    const AstNode* operand() const { return child.get(); }

protected:
    void releaseChildren(std::vector<std::unique_ptr<AstNode>>& pending) override;

private:
    std::unique_ptr<AstNode> child;
};

// Форматирует число кратчайшей десятичной записью без экспоненты: 42, 3.14, 0.00001.
// Бесконечность и NaN печатаются как "inf", "-inf", "nan".
std::string formatNumber(double value);

} // namespace compute
