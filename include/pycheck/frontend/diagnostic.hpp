#ifndef PYCHECK_FRONTEND_DIAGNOSTIC_HPP
#define PYCHECK_FRONTEND_DIAGNOSTIC_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace pycheck::frontend {

// `message` holds the complete rendered text, location included.
struct Diagnostic {
    std::size_t line = 0;
    std::size_t column = 0;
    std::string message;
};

std::vector<std::string> Messages(const std::vector<Diagnostic>& diagnostics);

}  // namespace pycheck::frontend

#endif  // PYCHECK_FRONTEND_DIAGNOSTIC_HPP
