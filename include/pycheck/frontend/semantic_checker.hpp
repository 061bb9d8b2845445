#ifndef PYCHECK_FRONTEND_SEMANTIC_CHECKER_HPP
#define PYCHECK_FRONTEND_SEMANTIC_CHECKER_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "pycheck/frontend/ast.hpp"
#include "pycheck/frontend/diagnostic.hpp"
#include "pycheck/frontend/parser.hpp"
#include "pycheck/frontend/token.hpp"
#include "pycheck/runtime/i18n.hpp"

namespace pycheck::frontend {

enum class VariableType {
    Int,
    String,
    Bool,
    Unknown,
};

const char* ToString(VariableType type);

struct Variable {
    std::string name;
    VariableType type = VariableType::Unknown;
    std::size_t line = 0;
};

// One flat table for the whole unit; the last assignment to a name wins.
using VariableTable = std::map<std::string, Variable>;

struct SemanticReport {
    std::vector<Diagnostic> errors;
    VariableTable variables;
    std::vector<Diagnostic> type_mismatches;
    bool success = true;
};

struct CheckerOptions {
    runtime::Language language = runtime::Language::English;
    std::size_t max_depth = kDefaultMaxDepth;
};

class SemanticChecker {
public:
    explicit SemanticChecker(CheckerOptions options = CheckerOptions());

    // A null root yields an empty, successful report.
    void Check(const std::vector<Token>& tokens, const SyntaxNode* root, SemanticReport* out_report) const;

private:
    CheckerOptions options_;
};

}  // namespace pycheck::frontend

#endif  // PYCHECK_FRONTEND_SEMANTIC_CHECKER_HPP
