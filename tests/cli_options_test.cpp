#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pycheck/cli/cli_options.hpp"

using pycheck::cli::CliOptions;
using pycheck::runtime::Language;

namespace {

class CliOptionsTest : public ::testing::Test {
protected:
    void TearDown() override { pycheck::runtime::SetLanguage(Language::English); }

    bool Parse(std::vector<const char*> args) {
        args.insert(args.begin(), "pycheck");
        return pycheck::cli::ParseArgs(static_cast<int>(args.size()), args.data(), &options_, &error_);
    }

    CliOptions options_;
    std::string error_;
};

}  // namespace

TEST_F(CliOptionsTest, Defaults) {
    ASSERT_TRUE(Parse({}));

    EXPECT_FALSE(options_.show_help);
    EXPECT_FALSE(options_.verbose);
    EXPECT_TRUE(options_.pretty);
    EXPECT_TRUE(options_.input_path.empty());
    EXPECT_EQ(options_.max_depth, pycheck::frontend::kDefaultMaxDepth);
    EXPECT_EQ(options_.language, Language::English);
}

TEST_F(CliOptionsTest, AllOptions) {
    ASSERT_TRUE(Parse({"--verbose", "--compact", "--max-depth", "32", "--lang", "es", "main.py"}));

    EXPECT_TRUE(options_.verbose);
    EXPECT_FALSE(options_.pretty);
    EXPECT_EQ(options_.max_depth, 32u);
    EXPECT_EQ(options_.language, Language::Spanish);
    EXPECT_EQ(pycheck::runtime::GetLanguage(), Language::Spanish);
    EXPECT_EQ(options_.input_path, "main.py");
}

TEST_F(CliOptionsTest, HelpFlags) {
    ASSERT_TRUE(Parse({"-h"}));
    EXPECT_TRUE(options_.show_help);

    options_ = CliOptions();
    ASSERT_TRUE(Parse({"--help"}));
    EXPECT_TRUE(options_.show_help);
}

TEST_F(CliOptionsTest, DashMeansStandardInput) {
    ASSERT_TRUE(Parse({"-"}));
    EXPECT_EQ(options_.input_path, "-");
}

TEST_F(CliOptionsTest, UnknownOption) {
    EXPECT_FALSE(Parse({"--fast"}));
    EXPECT_EQ(error_, "Unknown option: --fast");
}

TEST_F(CliOptionsTest, MissingLanguageValue) {
    EXPECT_FALSE(Parse({"--lang"}));
    EXPECT_EQ(error_, "Missing value for --lang.");
}

TEST_F(CliOptionsTest, InvalidLanguage) {
    EXPECT_FALSE(Parse({"--lang", "fr"}));
    EXPECT_EQ(error_, "Invalid language. Use es or en.");
}

TEST_F(CliOptionsTest, InvalidDepth) {
    EXPECT_FALSE(Parse({"--max-depth", "0"}));
    EXPECT_EQ(error_, "Invalid depth: 0");

    EXPECT_FALSE(Parse({"--max-depth", "-3"}));
    EXPECT_EQ(error_, "Invalid depth: -3");

    EXPECT_FALSE(Parse({"--max-depth", "10000000"}));
    EXPECT_EQ(error_, "Invalid depth: 10000000");

    EXPECT_FALSE(Parse({"--max-depth"}));
    EXPECT_EQ(error_, "Missing value for --max-depth.");
}

TEST_F(CliOptionsTest, MultipleInputs) {
    EXPECT_FALSE(Parse({"a.py", "b.py"}));
    EXPECT_EQ(error_, "Multiple input files were provided.");
}

TEST_F(CliOptionsTest, ErrorsFollowSelectedLanguage) {
    EXPECT_FALSE(Parse({"--lang", "es", "--bogus"}));
    EXPECT_EQ(error_, "Opcion desconocida: --bogus");
}
