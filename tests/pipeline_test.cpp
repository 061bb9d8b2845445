#include <gtest/gtest.h>

#include <cstddef>
#include <future>
#include <string>
#include <vector>

#include "pycheck/analysis/pipeline.hpp"
#include "pycheck/analysis/report_json.hpp"

using pycheck::analysis::AnalysisOptions;
using pycheck::analysis::Analyze;
using pycheck::analysis::FormatReportJson;
using pycheck::analysis::Report;

namespace {

constexpr const char* kSample =
    "def greet(name):\n"
    "    message = 'hello'\n"
    "    print(message)\n"
    "count = 3\n"
    "if count > 'a':\n"
    "    count.lower()\n";

}  // namespace

TEST(PipelineTest, CleanProgramSucceeds) {
    const Report report = Analyze("x = 5\ny = x + 1\nprint(y)");

    EXPECT_TRUE(report.success);
    EXPECT_TRUE(report.error.empty());
    EXPECT_TRUE(report.syntax.success);
    EXPECT_TRUE(report.semantic.success);
    EXPECT_EQ(report.semantic.variables.size(), 2u);
}

TEST(PipelineTest, SameInputGivesSameReport) {
    const std::string first = FormatReportJson(Analyze(kSample), true);
    const std::string second = FormatReportJson(Analyze(kSample), true);

    EXPECT_EQ(first, second);
}

TEST(PipelineTest, LexicalErrorAloneKeepsSuccess) {
    const Report report = Analyze("x = 1 `");

    ASSERT_EQ(report.lexical.errors.size(), 1u);
    EXPECT_TRUE(report.syntax.errors.empty());
    EXPECT_TRUE(report.semantic.errors.empty());
    EXPECT_TRUE(report.success);
    EXPECT_TRUE(report.error.empty());
}

TEST(PipelineTest, SyntaxErrorsAreSummarizedFirst) {
    const Report report = Analyze("x = 'a' - 1\n)\n)");

    EXPECT_FALSE(report.success);
    EXPECT_FALSE(report.semantic.errors.empty());
    EXPECT_EQ(
        report.error,
        "syntax errors: [error at line 2: expected expression error at line 3: expected expression]");
}

TEST(PipelineTest, SemanticErrorsSummary) {
    const Report report = Analyze("x = 5\nx.lower()");

    EXPECT_FALSE(report.success);
    EXPECT_TRUE(report.syntax.success);
    EXPECT_EQ(
        report.error,
        "semantic errors: [semantic error at line 2: method 'lower()' is not available for the type of 'x']");
}

TEST(PipelineTest, SpanishSummary) {
    AnalysisOptions options;
    options.language = pycheck::runtime::Language::Spanish;
    const Report report = Analyze("x = 5\nx.lower()", options);

    EXPECT_EQ(
        report.error,
        "Errores semánticos: [Error semántico en línea 2: El método 'lower()' no está disponible para el tipo "
        "de 'x']");
}

TEST(PipelineTest, SampleProgramFindsBothSemanticErrors) {
    const Report report = Analyze(kSample);

    EXPECT_TRUE(report.syntax.success);
    ASSERT_EQ(report.semantic.errors.size(), 2u);
    EXPECT_EQ(report.semantic.type_mismatches.size(), 1u);
    EXPECT_EQ(report.semantic.variables.at("message").line, 2u);
    EXPECT_EQ(report.semantic.variables.count("name"), 0u);
}

TEST(PipelineTest, DepthCeilingIsPassedToTheParser) {
    AnalysisOptions options;
    options.max_depth = 4;
    const Report report = Analyze("x = ((((((1))))))", options);

    EXPECT_FALSE(report.success);
    ASSERT_FALSE(report.syntax.errors.empty());
    EXPECT_EQ(report.syntax.errors[0].message, "error at line 1: maximum nesting depth of 4 exceeded");
}

TEST(PipelineTest, ConcurrentAnalysesDoNotInterfere) {
    const std::vector<std::string> sources = {
        kSample,
        "x = 5\nx.lower()",
        "a * b",
        "s = 'a' + 'b'",
    };

    std::vector<std::string> expected;
    for (const auto& source : sources) {
        expected.push_back(FormatReportJson(Analyze(source), false));
    }

    std::vector<std::future<std::string>> pending;
    for (int round = 0; round < 4; ++round) {
        for (const auto& source : sources) {
            pending.push_back(std::async(std::launch::async, [&source]() {
                return FormatReportJson(Analyze(source), false);
            }));
        }
    }

    for (std::size_t i = 0; i < pending.size(); ++i) {
        EXPECT_EQ(pending[i].get(), expected[i % sources.size()]);
    }
}

TEST(PipelineTest, NestedCallsAtTheCeilingPassBothStages) {
    const std::size_t calls = pycheck::frontend::kDefaultMaxDepth - 1;
    std::string source = "x = ";
    for (std::size_t i = 0; i < calls; ++i) {
        source += "f(";
    }
    source += "1" + std::string(calls, ')');

    const Report report = Analyze(source);

    EXPECT_TRUE(report.syntax.errors.empty());
    EXPECT_TRUE(report.semantic.errors.empty());
    EXPECT_TRUE(report.success);
}

TEST(PipelineTest, ComparisonOverLongTermPassesBothStages) {
    AnalysisOptions options;
    options.max_depth = 8;

    const Report accepted = Analyze("x = 1 + 1 + 1 + 1 > 2 > 3 > 4 > 5", options);
    EXPECT_TRUE(accepted.syntax.errors.empty());
    EXPECT_TRUE(accepted.semantic.errors.empty());
    EXPECT_TRUE(accepted.success);

    const Report rejected = Analyze("x = 1 + 1 + 1 + 1 > 2 > 3 > 4 > 5 > 6", options);
    ASSERT_EQ(rejected.syntax.errors.size(), 1u);
    EXPECT_EQ(rejected.syntax.errors[0].message, "error at line 1: maximum nesting depth of 8 exceeded");
    EXPECT_TRUE(rejected.semantic.errors.empty());
}
