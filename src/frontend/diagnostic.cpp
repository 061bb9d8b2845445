#include "pycheck/frontend/diagnostic.hpp"

namespace pycheck::frontend {

std::vector<std::string> Messages(const std::vector<Diagnostic>& diagnostics) {
    std::vector<std::string> messages;
    messages.reserve(diagnostics.size());
    for (const auto& diagnostic : diagnostics) {
        messages.push_back(diagnostic.message);
    }
    return messages;
}

}  // namespace pycheck::frontend
