#ifndef PYCHECK_FRONTEND_PARSER_HPP
#define PYCHECK_FRONTEND_PARSER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "pycheck/frontend/ast.hpp"
#include "pycheck/frontend/diagnostic.hpp"
#include "pycheck/frontend/token.hpp"
#include "pycheck/runtime/i18n.hpp"

namespace pycheck::frontend {

constexpr std::size_t kDefaultMaxDepth = 256;

struct ParserOptions {
    runtime::Language language = runtime::Language::English;
    std::size_t max_depth = kDefaultMaxDepth;
};

struct SyntaxResult {
    std::unique_ptr<SyntaxNode> root;
    std::vector<Diagnostic> errors;
    bool success = true;
    std::size_t error_line = 0;
};

// Recursive descent over the significant tokens of one source unit. Every
// grammar violation is recorded and skipped; Parse always yields a Program.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens, ParserOptions options = ParserOptions());

    SyntaxResult Parse();

private:
    std::unique_ptr<SyntaxNode> ParseProgram();
    std::unique_ptr<SyntaxNode> ParseStatement();
    std::unique_ptr<SyntaxNode> ParseFunctionDef();
    std::unique_ptr<SyntaxNode> ParseIfStatement();
    std::unique_ptr<SyntaxNode> ParseBlock();
    std::unique_ptr<SyntaxNode> ParseAssignment();
    std::unique_ptr<SyntaxNode> ParseExpressionStatement();

    // out_height receives the number of expression levels in the returned
    // subtree; nothing taller than max_depth is ever attached.
    std::unique_ptr<SyntaxNode> ParseExpression(std::size_t* out_height);
    std::unique_ptr<SyntaxNode> ParseComparison(std::size_t* out_height);
    std::unique_ptr<SyntaxNode> ParseTerm(std::size_t* out_height);
    std::unique_ptr<SyntaxNode> ParseFactor(std::size_t* out_height);
    std::unique_ptr<SyntaxNode> FinishCall(
        std::unique_ptr<SyntaxNode> call,
        bool method_call,
        std::size_t* out_height);

    bool IsAtEnd() const;
    const Token& Peek() const;
    const Token& Previous() const;
    const Token& Advance();
    bool CheckKind(TokenKind kind) const;
    bool CheckKeyword(const char* keyword) const;
    bool CheckNextKeyword(const char* keyword) const;
    bool CheckSymbol(const char* symbol) const;
    bool CheckNextSymbol(const char* symbol) const;
    bool MatchKeyword(const char* keyword);
    bool MatchSymbol(const char* symbol);
    bool MatchOperator(bool comparison, BinaryOperator* out_op);

    bool EnterNesting();
    void LeaveNesting();

    void Expected(const std::string& spanish, const std::string& english);
    void ReportDepthExceeded();

    std::vector<Token> tokens_;
    ParserOptions options_;
    std::size_t cursor_ = 0;
    std::size_t depth_ = 0;
    bool depth_reported_ = false;
    bool unwinding_ = false;
    std::vector<Diagnostic> errors_;
};

// Drops Whitespace and Newline tokens, and Error tokens, which the scanner
// has already accounted for.
std::vector<Token> SignificantTokens(const std::vector<Token>& tokens);

}  // namespace pycheck::frontend

#endif  // PYCHECK_FRONTEND_PARSER_HPP
