#include "pycheck/frontend/parser.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include "parser_support.hpp"

namespace pycheck::frontend {

std::unique_ptr<SyntaxNode> Parser::ParseExpression(std::size_t* out_height) {
    if (!EnterNesting()) {
        return nullptr;
    }

    auto expression = ParseComparison(out_height);
    LeaveNesting();
    return expression;
}

std::unique_ptr<SyntaxNode> Parser::ParseComparison(std::size_t* out_height) {
    std::size_t height = 0;
    auto expression = ParseTerm(&height);
    if (expression == nullptr) {
        return nullptr;
    }

    BinaryOperator op = BinaryOperator::Equal;
    while (MatchOperator(true, &op)) {
        std::size_t rhs_height = 0;
        auto rhs = ParseTerm(&rhs_height);
        if (rhs == nullptr && unwinding_) {
            return nullptr;
        }

        // Operands past the ceiling are consumed but not attached.
        const std::size_t folded = std::max(height, rhs_height) + 1;
        if (folded > options_.max_depth) {
            ReportDepthExceeded();
            continue;
        }

        height = folded;
        expression = internal::MakeBinary(op, std::move(expression), std::move(rhs));
    }

    *out_height = height;
    return expression;
}

std::unique_ptr<SyntaxNode> Parser::ParseTerm(std::size_t* out_height) {
    std::size_t height = 0;
    auto expression = ParseFactor(&height);
    if (expression == nullptr) {
        return nullptr;
    }

    BinaryOperator op = BinaryOperator::Add;
    while (MatchOperator(false, &op)) {
        std::size_t rhs_height = 0;
        auto rhs = ParseFactor(&rhs_height);
        if (rhs == nullptr && unwinding_) {
            return nullptr;
        }

        const std::size_t folded = std::max(height, rhs_height) + 1;
        if (folded > options_.max_depth) {
            ReportDepthExceeded();
            continue;
        }

        height = folded;
        expression = internal::MakeBinary(op, std::move(expression), std::move(rhs));
    }

    *out_height = height;
    return expression;
}

std::unique_ptr<SyntaxNode> Parser::ParseFactor(std::size_t* out_height) {
    if (MatchSymbol("(")) {
        auto expression = ParseExpression(out_height);
        if (unwinding_) {
            return nullptr;
        }

        if (!MatchSymbol(")")) {
            Expected("')' después de la expresión", "')' after expression");
        }
        return expression;
    }

    if (CheckKind(TokenKind::Number)) {
        const Token& token = Advance();
        *out_height = 1;
        return MakeNode(token.line, NumberNode{token.text});
    }

    if (CheckKind(TokenKind::String)) {
        const Token& token = Advance();
        *out_height = 1;
        return MakeNode(token.line, StringNode{token.text});
    }

    if (CheckKeyword("print")) {
        const Token name_token = Advance();
        if (!CheckSymbol("(")) {
            Expected("'(' después de print", "'(' after print");
            return nullptr;
        }
        return FinishCall(MakeNode(name_token.line, FunctionCallNode{name_token.text}), false, out_height);
    }

    if (CheckKind(TokenKind::Identifier)) {
        const Token name_token = Advance();

        if (CheckSymbol("(")) {
            return FinishCall(MakeNode(name_token.line, FunctionCallNode{name_token.text}), false, out_height);
        }

        if (MatchSymbol(".")) {
            if (!CheckKind(TokenKind::Identifier)) {
                Expected("nombre de método después de '.'", "method name after '.'");
                return nullptr;
            }

            const Token method_token = Advance();
            if (CheckSymbol("(")) {
                return FinishCall(
                    MakeNode(name_token.line, MethodCallNode{name_token.text, method_token.text}),
                    true,
                    out_height);
            }
        }

        *out_height = 1;
        return MakeNode(name_token.line, IdentifierNode{name_token.text});
    }

    Expected("expresión", "expression");
    return nullptr;
}

std::unique_ptr<SyntaxNode> Parser::FinishCall(
    std::unique_ptr<SyntaxNode> call,
    bool method_call,
    std::size_t* out_height) {
    MatchSymbol("(");

    std::size_t height = 1;
    if (!CheckSymbol(")")) {
        while (true) {
            std::size_t argument_height = 0;
            auto argument = ParseExpression(&argument_height);
            if (argument == nullptr && unwinding_) {
                return nullptr;
            }

            if (argument != nullptr && argument_height + 1 > options_.max_depth) {
                ReportDepthExceeded();
            } else if (argument != nullptr) {
                height = std::max(height, argument_height + 1);
                call->AddChild(std::move(argument));
            }

            if (!MatchSymbol(",")) {
                break;
            }
        }
    }

    if (!MatchSymbol(")")) {
        if (method_call) {
            Expected("')' después de los argumentos del método", "')' after method arguments");
        } else {
            Expected("')' después de los argumentos", "')' after arguments");
        }
    }

    *out_height = height;
    return call;
}

}  // namespace pycheck::frontend
