#include "pycheck/frontend/parser.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "parser_support.hpp"

namespace pycheck::frontend {

std::vector<Token> SignificantTokens(const std::vector<Token>& tokens) {
    std::vector<Token> filtered;
    filtered.reserve(tokens.size());
    for (const auto& token : tokens) {
        if (token.kind != TokenKind::Whitespace &&
            token.kind != TokenKind::Newline &&
            token.kind != TokenKind::Error) {
            filtered.push_back(token);
        }
    }
    return filtered;
}

Parser::Parser(std::vector<Token> tokens, ParserOptions options)
    : tokens_(SignificantTokens(tokens)), options_(options) {}

SyntaxResult Parser::Parse() {
    cursor_ = 0;
    depth_ = 0;
    depth_reported_ = false;
    unwinding_ = false;
    errors_.clear();

    SyntaxResult result;
    result.root = ParseProgram();
    result.errors = std::move(errors_);
    result.success = result.errors.empty();
    result.error_line = result.errors.empty() ? 0 : result.errors.front().line;
    return result;
}

std::unique_ptr<SyntaxNode> Parser::ParseProgram() {
    auto program = MakeNode(1, ProgramNode{});

    while (!IsAtEnd()) {
        auto statement = ParseStatement();
        if (statement != nullptr) {
            program->AddChild(std::move(statement));
        } else {
            Advance();
        }
    }

    return program;
}

std::unique_ptr<SyntaxNode> Parser::ParseStatement() {
    unwinding_ = false;

    if (MatchKeyword("def")) {
        return ParseFunctionDef();
    }

    if (MatchKeyword("if")) {
        return ParseIfStatement();
    }

    if (CheckKeyword("print")) {
        return ParseExpressionStatement();
    }

    if (CheckKind(TokenKind::Identifier) && CheckNextSymbol("=")) {
        return ParseAssignment();
    }

    return ParseExpressionStatement();
}

bool Parser::IsAtEnd() const {
    return cursor_ >= tokens_.size();
}

const Token& Parser::Peek() const {
    static const Token kEndOfInput;
    if (IsAtEnd()) {
        return kEndOfInput;
    }
    return tokens_[cursor_];
}

const Token& Parser::Previous() const {
    static const Token kNoToken;
    if (cursor_ == 0) {
        return kNoToken;
    }
    return tokens_[cursor_ - 1];
}

const Token& Parser::Advance() {
    if (!IsAtEnd()) {
        ++cursor_;
    }
    return Previous();
}

bool Parser::CheckKind(TokenKind kind) const {
    return !IsAtEnd() && tokens_[cursor_].kind == kind;
}

bool Parser::CheckKeyword(const char* keyword) const {
    return !IsAtEnd() && internal::IsKeyword(tokens_[cursor_], keyword);
}

bool Parser::CheckNextKeyword(const char* keyword) const {
    return cursor_ + 1 < tokens_.size() && internal::IsKeyword(tokens_[cursor_ + 1], keyword);
}

bool Parser::CheckSymbol(const char* symbol) const {
    return !IsAtEnd() && internal::IsSymbol(tokens_[cursor_], symbol);
}

bool Parser::CheckNextSymbol(const char* symbol) const {
    return cursor_ + 1 < tokens_.size() && internal::IsSymbol(tokens_[cursor_ + 1], symbol);
}

bool Parser::MatchKeyword(const char* keyword) {
    if (!CheckKeyword(keyword)) {
        return false;
    }
    ++cursor_;
    return true;
}

bool Parser::MatchSymbol(const char* symbol) {
    if (!CheckSymbol(symbol)) {
        return false;
    }
    ++cursor_;
    return true;
}

bool Parser::MatchOperator(bool comparison, BinaryOperator* out_op) {
    if (IsAtEnd()) {
        return false;
    }

    const bool matched = comparison
        ? internal::ToComparisonOperator(tokens_[cursor_], out_op)
        : internal::ToAdditiveOperator(tokens_[cursor_], out_op);
    if (matched) {
        ++cursor_;
    }
    return matched;
}

bool Parser::EnterNesting() {
    if (depth_ >= options_.max_depth) {
        unwinding_ = true;
        ReportDepthExceeded();
        return false;
    }
    ++depth_;
    return true;
}

void Parser::LeaveNesting() {
    if (depth_ > 0) {
        --depth_;
    }
}

void Parser::Expected(const std::string& spanish, const std::string& english) {
    const std::size_t line = IsAtEnd() ? 1 : Peek().line;
    const std::size_t column = IsAtEnd() ? 0 : Peek().column;
    errors_.push_back(Diagnostic{
        line,
        column,
        runtime::Tr(
            options_.language,
            "Error en línea " + std::to_string(line) + ": Se esperaba " + spanish,
            "error at line " + std::to_string(line) + ": expected " + english),
    });
}

void Parser::ReportDepthExceeded() {
    if (depth_reported_) {
        return;
    }
    depth_reported_ = true;

    const std::size_t line = IsAtEnd() ? 1 : Peek().line;
    const std::string limit = std::to_string(options_.max_depth);
    errors_.push_back(Diagnostic{
        line,
        IsAtEnd() ? 0 : Peek().column,
        runtime::Tr(
            options_.language,
            "Error en línea " + std::to_string(line) + ": Se superó la profundidad máxima de anidamiento (" +
                limit + ")",
            "error at line " + std::to_string(line) + ": maximum nesting depth of " + limit + " exceeded"),
    });
}

}  // namespace pycheck::frontend
