#ifndef PYCHECK_FRONTEND_PARSER_SUPPORT_HPP
#define PYCHECK_FRONTEND_PARSER_SUPPORT_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "pycheck/frontend/ast.hpp"
#include "pycheck/frontend/token.hpp"

namespace pycheck::frontend::internal {

inline bool IsKeyword(const Token& token, const char* keyword) {
    return token.kind == TokenKind::Keyword && token.text == keyword;
}

inline bool IsSymbol(const Token& token, const char* symbol) {
    return token.kind == TokenKind::Symbol && token.text == symbol;
}

inline bool ToComparisonOperator(const Token& token, BinaryOperator* out_op) {
    BinaryOperator op = BinaryOperator::Add;
    if (token.kind != TokenKind::Symbol || !ParseBinaryOperator(token.text, &op) || !IsComparison(op)) {
        return false;
    }
    *out_op = op;
    return true;
}

inline bool ToAdditiveOperator(const Token& token, BinaryOperator* out_op) {
    if (IsSymbol(token, "+")) {
        *out_op = BinaryOperator::Add;
        return true;
    }
    if (IsSymbol(token, "-")) {
        *out_op = BinaryOperator::Subtract;
        return true;
    }
    return false;
}

// A missing right operand leaves the operation with a single child.
inline std::unique_ptr<SyntaxNode> MakeBinary(
    BinaryOperator op,
    std::unique_ptr<SyntaxNode> lhs,
    std::unique_ptr<SyntaxNode> rhs) {
    auto node = MakeNode(lhs->line, BinaryOpNode{op});
    node->AddChild(std::move(lhs));
    node->AddChild(std::move(rhs));
    return node;
}

}  // namespace pycheck::frontend::internal

#endif  // PYCHECK_FRONTEND_PARSER_SUPPORT_HPP
