#include "pycheck/frontend/parser.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "parser_support.hpp"

namespace pycheck::frontend {

std::unique_ptr<SyntaxNode> Parser::ParseFunctionDef() {
    const std::size_t line = Previous().line;

    if (!CheckKind(TokenKind::Identifier)) {
        Expected("nombre de función", "function name");
        return nullptr;
    }

    const std::string name = Advance().text;

    if (!MatchSymbol("(")) {
        Expected("'(' después del nombre de función", "'(' after function name");
        return nullptr;
    }

    std::vector<std::unique_ptr<SyntaxNode>> params;
    if (!CheckSymbol(")")) {
        while (true) {
            if (!CheckKind(TokenKind::Identifier)) {
                Expected("nombre de parámetro", "parameter name");
                break;
            }

            const Token& param = Advance();
            params.push_back(MakeNode(param.line, ParameterNode{param.text}));

            if (!MatchSymbol(",")) {
                break;
            }
        }
    }

    if (!MatchSymbol(")")) {
        Expected("')' después de los parámetros", "')' after parameters");
        return nullptr;
    }

    if (!MatchSymbol(":")) {
        Expected("':' después de la definición de función", "':' after function definition");
        return nullptr;
    }

    auto function = MakeNode(line, FunctionDefNode{name});
    for (auto& param : params) {
        function->AddChild(std::move(param));
    }
    function->AddChild(ParseBlock());
    return function;
}

std::unique_ptr<SyntaxNode> Parser::ParseIfStatement() {
    const std::size_t line = Previous().line;

    std::size_t height = 0;
    auto condition = ParseExpression(&height);
    if (condition == nullptr) {
        return nullptr;
    }

    if (!MatchSymbol(":")) {
        Expected("':' después de la condición if", "':' after if condition");
        return nullptr;
    }

    auto statement = MakeNode(line, IfStatementNode{});
    statement->AddChild(std::move(condition));
    statement->AddChild(ParseBlock());
    return statement;
}

// Blocks are delimited by lookahead, not indentation: the block closes as
// soon as the current or the next token is 'def' or 'if', and it never
// consumes the final token of the input.
std::unique_ptr<SyntaxNode> Parser::ParseBlock() {
    auto block = MakeNode(IsAtEnd() ? 0 : Peek().line, BlockNode{});

    while (!IsAtEnd() &&
           !CheckKeyword("def") && !CheckKeyword("if") &&
           !CheckNextKeyword("def") && !CheckNextKeyword("if")) {
        auto statement = ParseStatement();
        if (statement != nullptr) {
            block->AddChild(std::move(statement));
        } else {
            Advance();
        }

        if (cursor_ + 1 >= tokens_.size()) {
            break;
        }
    }

    return block;
}

std::unique_ptr<SyntaxNode> Parser::ParseAssignment() {
    const std::size_t line = Peek().line;

    if (!CheckKind(TokenKind::Identifier)) {
        Expected("identificador en asignación", "identifier in assignment");
        return nullptr;
    }

    const std::string name = Advance().text;

    if (!MatchSymbol("=")) {
        Expected("'=' en asignación", "'=' in assignment");
        return nullptr;
    }

    std::size_t height = 0;
    auto value = ParseExpression(&height);
    if (value == nullptr) {
        return nullptr;
    }

    auto assignment = MakeNode(line, AssignmentNode{name});
    assignment->AddChild(std::move(value));
    return assignment;
}

std::unique_ptr<SyntaxNode> Parser::ParseExpressionStatement() {
    std::size_t height = 0;
    auto expression = ParseExpression(&height);
    if (expression == nullptr) {
        return nullptr;
    }

    auto statement = MakeNode(expression->line, ExpressionStatementNode{});
    statement->AddChild(std::move(expression));
    return statement;
}

}  // namespace pycheck::frontend
