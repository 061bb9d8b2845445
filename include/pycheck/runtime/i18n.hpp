#ifndef PYCHECK_RUNTIME_I18N_HPP
#define PYCHECK_RUNTIME_I18N_HPP

#include <string>

namespace pycheck::runtime {

enum class Language {
    English,
    Spanish,
};

bool ParseLanguage(const std::string& text, Language* out_language);

// Process-wide language used by the command line front end. The analysis
// pipeline never reads it; it receives its language per call.
void SetLanguage(Language language);
Language GetLanguage();

std::string Tr(Language language, const std::string& spanish, const std::string& english);
std::string Tr(const std::string& spanish, const std::string& english);

}  // namespace pycheck::runtime

#endif  // PYCHECK_RUNTIME_I18N_HPP
