#include "compute/ast.hpp"

#include "compute/error.hpp"

#include <charconv>
#include <cmath>

namespace compute {

namespace {
// Литерал, который при разборе снова переполняется до бесконечности (больше DBL_MAX)
const std::string kOverflowLiteral = "1" + std::string(309, '0');

const AstNode& requireChild(const AstNode* node, const char* role) {
    if (node == nullptr) {
        throw ComputeException({ErrorKind::InvalidStructure,
                                std::string("отсутствует ") + role + " операнд"});
    }
    return *node;
}

double applyBinary(NodeKind kind, double leftValue, double rightValue) {
    switch (kind) {
    case NodeKind::Add:
        return leftValue + rightValue;
    case NodeKind::Sub:
        return leftValue - rightValue;
    case NodeKind::Mul:
        return leftValue * rightValue;
    case NodeKind::Div:
        // Сравнение точное: и +0.0, и -0.0 считаются нулём
        if (rightValue == 0.0) {
            throw ComputeException({ErrorKind::DivisionByZero, "делитель равен нулю"});
        }
        return leftValue / rightValue;
    case NodeKind::Number:
    case NodeKind::Neg:
        break;
    }
    throw ComputeException({ErrorKind::InvalidStructure, "узел не является бинарной операцией"});
}

// Вычисление в обратной польской записи: узел снимается со стека дважды,
// до и после вычисления потомков
double evaluateTree(const AstNode& root) {
    struct Step {
        const AstNode* node;
        bool childrenReady;
    };

    std::vector<Step> steps{{&root, false}};
    std::vector<double> values;

    while (!steps.empty()) {
        Step step = steps.back();
        steps.pop_back();

        if (auto binary = dynamic_cast<const BinaryNode*>(step.node)) {
            if (!step.childrenReady) {
                const AstNode& left = requireChild(binary->left(), "левый");
                const AstNode& right = requireChild(binary->right(), "правый");
                steps.push_back({binary, true});
                steps.push_back({&right, false});
                steps.push_back({&left, false});
                continue;
            }
            double rightValue = values.back();
            values.pop_back();
            values.back() = applyBinary(binary->kind(), values.back(), rightValue);
        } else if (auto negate = dynamic_cast<const NegateNode*>(step.node)) {
            if (!step.childrenReady) {
                const AstNode& operand = requireChild(negate->operand(), "унарный");
                steps.push_back({negate, true});
                steps.push_back({&operand, false});
                continue;
            }
            values.back() = -values.back();
        } else {
            values.push_back(step.node->evaluate());
        }
    }
    return values.back();
}

// Уровень приоритета бинарной операции: 1 для + и -, 2 для * и /, 0 для прочих
int precedence(NodeKind kind) {
    switch (kind) {
    case NodeKind::Add:
    case NodeKind::Sub:
        return 1;
    case NodeKind::Mul:
    case NodeKind::Div:
        return 2;
    default:
        return 0;
    }
}

// Левый операнд того же уровня приоритета печатается без своих скобок:
// "(a - b - c)" разбирается обратно в то же левоассоциативное дерево
bool continuesChain(const AstNode* left, NodeKind parent) {
    return dynamic_cast<const BinaryNode*>(left) != nullptr &&
           precedence(parent) > 0 && precedence(left->kind()) == precedence(parent);
}

// Печать по явному стеку: элемент стека либо узел, либо готовый фрагмент текста
std::string printTree(const AstNode& root) {
    struct Piece {
        const AstNode* node;
        std::string text;
        bool withoutParens;
    };

    std::vector<Piece> pieces{{&root, {}, false}};
    std::string out;

    while (!pieces.empty()) {
        Piece piece = std::move(pieces.back());
        pieces.pop_back();

        if (piece.node == nullptr) {
            out += piece.text;
            continue;
        }

        if (auto binary = dynamic_cast<const BinaryNode*>(piece.node)) {
            const AstNode* left = binary->left();
            const AstNode* right = binary->right();
            // Кладется в обратном порядке: "(", левый, " op ", правый, ")"
            if (!piece.withoutParens) {
                pieces.push_back({nullptr, ")", false});
            }
            pieces.push_back({right, right ? "" : "?", false});
            pieces.push_back({nullptr, std::string(" ") + operatorSymbol(binary->kind()) + " ", false});
            pieces.push_back({left, left ? "" : "?", continuesChain(left, binary->kind())});
            if (!piece.withoutParens) {
                pieces.push_back({nullptr, "(", false});
            }
        } else if (auto negate = dynamic_cast<const NegateNode*>(piece.node)) {
            pieces.push_back({negate->operand(), negate->operand() ? "" : "?", false});
            pieces.push_back({nullptr, "-", false});
        } else {
            out += piece.node->toString();
        }
    }
    return out;
}
}

char operatorSymbol(NodeKind kind) {
    switch (kind) {
    case NodeKind::Add:
        return '+';
    case NodeKind::Sub:
    case NodeKind::Neg:
        return '-';
    case NodeKind::Mul:
        return '*';
    case NodeKind::Div:
        return '/';
    case NodeKind::Number:
        break;
    }
    return '\0';
}

std::string formatNumber(double value) {
    // Кратчайшая запись в фиксированном формате; для DBL_MAX это около 310 символов
    char buffer[512];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value,
                                   std::chars_format::fixed);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, end);
}

void AstNode::destroyAll(std::vector<std::unique_ptr<AstNode>> pending) {
    while (!pending.empty()) {
        std::unique_ptr<AstNode> node = std::move(pending.back());
        pending.pop_back();
        if (node) {
            node->releaseChildren(pending);
        }
        // Здесь node разрушается уже без потомков
    }
}

// Бесконечность печатается литералом, который снова переполняется при разборе
std::string NumberNode::toString() const {
    if (std::isinf(number)) {
        return number > 0 ? kOverflowLiteral : "-" + kOverflowLiteral;
    }
    return formatNumber(number);
}

BinaryNode::~BinaryNode() {
    std::vector<std::unique_ptr<AstNode>> pending;
    releaseChildren(pending);
    destroyAll(std::move(pending));
}

void BinaryNode::releaseChildren(std::vector<std::unique_ptr<AstNode>>& pending) {
    pending.push_back(std::move(lhs));
    pending.push_back(std::move(rhs));
}

double BinaryNode::evaluate() const {
    return evaluateTree(*this);
}

std::string BinaryNode::toString() const {
    return printTree(*this);
}

NegateNode::~NegateNode() {
    std::vector<std::unique_ptr<AstNode>> pending;
    releaseChildren(pending);
    destroyAll(std::move(pending));
}

void NegateNode::releaseChildren(std::vector<std::unique_ptr<AstNode>>& pending) {
    pending.push_back(std::move(child));
}

double NegateNode::evaluate() const {
    return evaluateTree(*this);
}

std::string NegateNode::toString() const {
    return printTree(*this);
}

} // namespace compute
