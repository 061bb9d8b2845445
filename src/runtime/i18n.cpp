#include "pycheck/runtime/i18n.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>

namespace pycheck::runtime {

namespace {

struct LanguageAlias {
    const char* name;
    Language language;
};

constexpr LanguageAlias kLanguageAliases[] = {
    {"en", Language::English},
    {"eng", Language::English},
    {"english", Language::English},
    {"es", Language::Spanish},
    {"spa", Language::Spanish},
    {"spanish", Language::Spanish},
};

// Written once by the command line before any analysis starts.
std::atomic<Language> g_cli_language(Language::English);

}  // namespace

bool ParseLanguage(const std::string& text, Language* out_language) {
    if (out_language == nullptr) {
        return false;
    }

    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    for (const LanguageAlias& alias : kLanguageAliases) {
        if (lowered == alias.name) {
            *out_language = alias.language;
            return true;
        }
    }
    return false;
}

void SetLanguage(Language language) {
    g_cli_language.store(language, std::memory_order_relaxed);
}

Language GetLanguage() {
    return g_cli_language.load(std::memory_order_relaxed);
}

std::string Tr(Language language, const std::string& spanish, const std::string& english) {
    return language == Language::Spanish ? spanish : english;
}

std::string Tr(const std::string& spanish, const std::string& english) {
    return Tr(GetLanguage(), spanish, english);
}

}  // namespace pycheck::runtime
