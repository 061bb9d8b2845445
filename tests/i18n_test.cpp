#include <gtest/gtest.h>

#include "pycheck/runtime/i18n.hpp"

using pycheck::runtime::Language;

namespace {

class I18nTest : public ::testing::Test {
protected:
    void TearDown() override { pycheck::runtime::SetLanguage(Language::English); }
};

}  // namespace

TEST_F(I18nTest, ParsesLanguageNames) {
    Language language = Language::English;

    EXPECT_TRUE(pycheck::runtime::ParseLanguage("es", &language));
    EXPECT_EQ(language, Language::Spanish);
    EXPECT_TRUE(pycheck::runtime::ParseLanguage("English", &language));
    EXPECT_EQ(language, Language::English);
    EXPECT_TRUE(pycheck::runtime::ParseLanguage("SPA", &language));
    EXPECT_EQ(language, Language::Spanish);
    EXPECT_TRUE(pycheck::runtime::ParseLanguage("eng", &language));
    EXPECT_EQ(language, Language::English);
}

TEST_F(I18nTest, RejectsUnknownLanguage) {
    Language language = Language::Spanish;

    EXPECT_FALSE(pycheck::runtime::ParseLanguage("fr", &language));
    EXPECT_FALSE(pycheck::runtime::ParseLanguage("", &language));
    EXPECT_EQ(language, Language::Spanish);
    EXPECT_FALSE(pycheck::runtime::ParseLanguage("en", nullptr));
}

TEST_F(I18nTest, DefaultsToEnglish) {
    EXPECT_EQ(pycheck::runtime::GetLanguage(), Language::English);
    EXPECT_EQ(pycheck::runtime::Tr("hola", "hello"), "hello");
}

TEST_F(I18nTest, GlobalLanguageSelectsText) {
    pycheck::runtime::SetLanguage(Language::Spanish);

    EXPECT_EQ(pycheck::runtime::GetLanguage(), Language::Spanish);
    EXPECT_EQ(pycheck::runtime::Tr("hola", "hello"), "hola");
}

TEST_F(I18nTest, ExplicitLanguageIgnoresGlobal) {
    pycheck::runtime::SetLanguage(Language::Spanish);

    EXPECT_EQ(pycheck::runtime::Tr(Language::English, "hola", "hello"), "hello");
    EXPECT_EQ(pycheck::runtime::Tr(Language::Spanish, "hola", "hello"), "hola");
}
