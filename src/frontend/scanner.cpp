#include "pycheck/frontend/scanner.hpp"

#include <cctype>
#include <string>
#include <unordered_set>

namespace pycheck::frontend {

namespace {

// Two character symbols come first so that "==" wins over "=".
constexpr const char* kSymbols[] = {
    "==", "!=", "<=", ">=", ">>", "<<", "**", "//", "+=", "-=", "*=", "/=",
    "=", "+", "-", "*", "/", "%", "<", ">", "(", ")", "[", "]", "{", "}",
    ":", ";", ",", ".", "&", "|", "^", "~", "!", "@", "#", "$", "?",
};

const std::unordered_set<std::string>& ReservedWords() {
    static const std::unordered_set<std::string> kReservedWords = {
        "def", "if", "else", "elif", "while",
        "for", "in", "try", "except", "finally",
        "with", "as", "pass", "break", "continue",
        "return", "yield", "import", "from", "class",
        "and", "or", "not", "is", "lambda",
        "None", "True", "False", "print",
    };
    return kReservedWords;
}

bool IsIdentifierStart(char character) {
    return std::isalpha(static_cast<unsigned char>(character)) || character == '_';
}

bool IsIdentifierBody(char character) {
    return std::isalnum(static_cast<unsigned char>(character)) || character == '_';
}

bool IsDigit(char character) {
    return std::isdigit(static_cast<unsigned char>(character)) != 0;
}

std::size_t StringLength(const std::string& line, std::size_t start, bool* out_terminated) {
    const char quote = line[start];
    std::size_t cursor = start + 1;
    while (cursor < line.size() && line[cursor] != quote) {
        if (line[cursor] == '\\' && cursor + 1 < line.size()) {
            cursor += 2;
        } else {
            ++cursor;
        }
    }

    if (cursor >= line.size()) {
        *out_terminated = false;
        return line.size() - start;
    }

    *out_terminated = true;
    return cursor + 1 - start;
}

std::size_t NumberLength(const std::string& line, std::size_t start) {
    std::size_t cursor = start;
    bool has_dot = false;
    while (cursor < line.size() && (IsDigit(line[cursor]) || line[cursor] == '.')) {
        if (line[cursor] == '.') {
            if (has_dot) {
                break;
            }
            has_dot = true;
        }
        ++cursor;
    }
    return cursor - start;
}

std::size_t SymbolLength(const std::string& line, std::size_t start) {
    if (start + 1 < line.size()) {
        const std::string two_char = line.substr(start, 2);
        for (const char* symbol : kSymbols) {
            if (two_char == symbol) {
                return 2;
            }
        }
    }

    const std::string one_char(1, line[start]);
    for (const char* symbol : kSymbols) {
        if (one_char == symbol) {
            return 1;
        }
    }

    return 0;
}

void AddToken(Token token, LexicalReport* report) {
    switch (token.kind) {
    case TokenKind::Keyword:
        report->table.reserved_words.push_back(token.text);
        ++report->statistics.keywords;
        break;
    case TokenKind::Identifier:
        report->table.identifiers.push_back(token.text);
        ++report->statistics.identifiers;
        break;
    case TokenKind::Number:
        report->table.numbers.push_back(token.text);
        ++report->statistics.numbers;
        break;
    case TokenKind::String:
        ++report->statistics.strings;
        break;
    case TokenKind::Symbol:
        report->table.symbols.push_back(token.text);
        ++report->statistics.symbols;
        break;
    case TokenKind::Error:
        report->table.errors.push_back(token.text);
        ++report->statistics.errors;
        break;
    case TokenKind::Whitespace:
    case TokenKind::Newline:
        break;
    }

    report->tokens.push_back(std::move(token));
}

}  // namespace

bool IsReservedWord(const std::string& text) {
    return ReservedWords().count(text) != 0;
}

Scanner::Scanner(runtime::Language language) : language_(language) {}

LexicalReport Scanner::Scan(const std::string& source) const {
    LexicalReport report;

    std::size_t line_number = 1;
    std::size_t line_start = 0;
    while (true) {
        const std::size_t line_end = source.find('\n', line_start);
        if (line_end == std::string::npos) {
            ScanLine(source.substr(line_start), line_number, &report);
            break;
        }

        ScanLine(source.substr(line_start, line_end - line_start), line_number, &report);
        line_start = line_end + 1;
        ++line_number;
    }

    report.reserved_words = report.statistics.keywords;
    return report;
}

void Scanner::ScanLine(const std::string& line, std::size_t line_number, LexicalReport* out_report) const {
    std::size_t index = 0;
    while (index < line.size()) {
        const char current = line[index];
        const std::size_t column = index + 1;

        if (std::isspace(static_cast<unsigned char>(current))) {
            ++index;
            continue;
        }

        if (current == '#') {
            break;
        }

        if (current == '"' || current == '\'') {
            bool terminated = false;
            const std::size_t length = StringLength(line, index, &terminated);
            AddToken(
                {terminated ? TokenKind::String : TokenKind::Error, line.substr(index, length), line_number, column},
                out_report);
            index += length;
            continue;
        }

        if (IsDigit(current)) {
            const std::size_t length = NumberLength(line, index);
            AddToken({TokenKind::Number, line.substr(index, length), line_number, column}, out_report);
            index += length;
            continue;
        }

        if (IsIdentifierStart(current)) {
            std::size_t cursor = index + 1;
            while (cursor < line.size() && IsIdentifierBody(line[cursor])) {
                ++cursor;
            }

            const std::string text = line.substr(index, cursor - index);
            AddToken(
                {IsReservedWord(text) ? TokenKind::Keyword : TokenKind::Identifier, text, line_number, column},
                out_report);
            index = cursor;
            continue;
        }

        const std::size_t symbol_length = SymbolLength(line, index);
        if (symbol_length > 0) {
            AddToken({TokenKind::Symbol, line.substr(index, symbol_length), line_number, column}, out_report);
            index += symbol_length;
            continue;
        }

        const std::string offending(1, current);
        out_report->errors.push_back(Diagnostic{
            line_number,
            column,
            runtime::Tr(
                language_,
                "Carácter no reconocido '" + offending + "' en línea " + std::to_string(line_number) +
                    ", columna " + std::to_string(column),
                "unrecognized character '" + offending + "' at line " + std::to_string(line_number) +
                    ", column " + std::to_string(column)),
        });
        AddToken({TokenKind::Error, offending, line_number, column}, out_report);
        ++index;
    }
}

}  // namespace pycheck::frontend
