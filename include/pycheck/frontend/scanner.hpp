#ifndef PYCHECK_FRONTEND_SCANNER_HPP
#define PYCHECK_FRONTEND_SCANNER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "pycheck/frontend/diagnostic.hpp"
#include "pycheck/frontend/token.hpp"
#include "pycheck/runtime/i18n.hpp"

namespace pycheck::frontend {

struct TokenStatistics {
    std::size_t keywords = 0;
    std::size_t identifiers = 0;
    std::size_t numbers = 0;
    std::size_t strings = 0;
    std::size_t symbols = 0;
    std::size_t errors = 0;
};

// Lexemes grouped by category. String literals are counted in the
// statistics but never listed here.
struct CategoryTable {
    std::vector<std::string> reserved_words;
    std::vector<std::string> identifiers;
    std::vector<std::string> numbers;
    std::vector<std::string> symbols;
    std::vector<std::string> errors;
};

struct LexicalReport {
    std::vector<Token> tokens;
    CategoryTable table;
    TokenStatistics statistics;
    std::vector<Diagnostic> errors;
    std::size_t reserved_words = 0;
};

bool IsReservedWord(const std::string& text);

class Scanner {
public:
    explicit Scanner(runtime::Language language = runtime::Language::English);

    LexicalReport Scan(const std::string& source) const;

private:
    void ScanLine(const std::string& line, std::size_t line_number, LexicalReport* out_report) const;

    runtime::Language language_;
};

}  // namespace pycheck::frontend

#endif  // PYCHECK_FRONTEND_SCANNER_HPP
