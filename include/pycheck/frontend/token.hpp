#ifndef PYCHECK_FRONTEND_TOKEN_HPP
#define PYCHECK_FRONTEND_TOKEN_HPP

#include <cstddef>
#include <string>

namespace pycheck::frontend {

// The ordinal values are part of the report format.
enum class TokenKind {
    Keyword = 0,
    Identifier = 1,
    Number = 2,
    String = 3,
    Symbol = 4,
    Whitespace = 5,
    Newline = 6,
    Error = 7,
};

struct Token {
    TokenKind kind = TokenKind::Error;
    std::string text;
    std::size_t line = 0;
    std::size_t column = 0;
};

}  // namespace pycheck::frontend

#endif  // PYCHECK_FRONTEND_TOKEN_HPP
