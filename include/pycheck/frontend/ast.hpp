#ifndef PYCHECK_FRONTEND_AST_HPP
#define PYCHECK_FRONTEND_AST_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pycheck::frontend {

enum class NodeKind {
    Program,
    FunctionDef,
    IfStatement,
    Block,
    Assignment,
    ExpressionStatement,
    BinaryOp,
    FunctionCall,
    MethodCall,
    Identifier,
    Number,
    String,
    Parameter,
};

enum class BinaryOperator {
    Greater,
    Less,
    GreaterEqual,
    LessEqual,
    Equal,
    NotEqual,
    Add,
    Subtract,
    Multiply,
    Divide,
};

bool ParseBinaryOperator(const std::string& text, BinaryOperator* out_op);
const char* ToString(BinaryOperator op);
const char* ToString(NodeKind kind);

bool IsRelational(BinaryOperator op);
bool IsEquality(BinaryOperator op);
bool IsComparison(BinaryOperator op);
bool IsArithmetic(BinaryOperator op);

struct ProgramNode {};

struct FunctionDefNode {
    std::string name;
};

struct IfStatementNode {};

struct BlockNode {};

struct AssignmentNode {
    std::string target;
};

struct ExpressionStatementNode {};

struct BinaryOpNode {
    BinaryOperator op = BinaryOperator::Add;
};

struct FunctionCallNode {
    std::string callee;
};

struct MethodCallNode {
    std::string object;
    std::string method;
};

struct IdentifierNode {
    std::string name;
};

struct NumberNode {
    std::string literal;
};

// The literal keeps its quotes.
struct StringNode {
    std::string literal;
};

struct ParameterNode {
    std::string name;
};

// Alternative order matches NodeKind.
using NodePayload = std::variant<
    ProgramNode,
    FunctionDefNode,
    IfStatementNode,
    BlockNode,
    AssignmentNode,
    ExpressionStatementNode,
    BinaryOpNode,
    FunctionCallNode,
    MethodCallNode,
    IdentifierNode,
    NumberNode,
    StringNode,
    ParameterNode>;

struct SyntaxNode {
    SyntaxNode(std::size_t in_line, NodePayload in_payload)
        : line(in_line), payload(std::move(in_payload)) {}

    NodeKind Kind() const { return static_cast<NodeKind>(payload.index()); }

    template <typename T>
    const T* As() const {
        return std::get_if<T>(&payload);
    }

    // Operator symbol, name or literal text; empty for structural nodes.
    std::string Value() const;

    void AddChild(std::unique_ptr<SyntaxNode> child) {
        if (child != nullptr) {
            children.push_back(std::move(child));
        }
    }

    std::size_t line = 0;
    NodePayload payload;
    std::vector<std::unique_ptr<SyntaxNode>> children;
};

template <typename T>
std::unique_ptr<SyntaxNode> MakeNode(std::size_t line, T payload) {
    return std::make_unique<SyntaxNode>(line, NodePayload(std::move(payload)));
}

}  // namespace pycheck::frontend

#endif  // PYCHECK_FRONTEND_AST_HPP
