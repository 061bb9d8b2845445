#include "pycheck/analysis/pipeline.hpp"

#include <string>
#include <utility>
#include <vector>

namespace pycheck::analysis {

namespace {

std::string JoinBracketed(const std::vector<frontend::Diagnostic>& diagnostics) {
    std::string joined = "[";
    for (std::size_t i = 0; i < diagnostics.size(); ++i) {
        if (i > 0) {
            joined.push_back(' ');
        }
        joined += diagnostics[i].message;
    }
    joined.push_back(']');
    return joined;
}

}  // namespace

Report Analyze(const std::string& source, const AnalysisOptions& options) {
    Report report;

    const frontend::Scanner scanner(options.language);
    report.lexical = scanner.Scan(source);

    frontend::ParserOptions parser_options;
    parser_options.language = options.language;
    parser_options.max_depth = options.max_depth;
    frontend::Parser parser(report.lexical.tokens, parser_options);
    report.syntax = parser.Parse();

    frontend::CheckerOptions checker_options;
    checker_options.language = options.language;
    checker_options.max_depth = options.max_depth;
    const frontend::SemanticChecker checker(checker_options);
    checker.Check(report.lexical.tokens, report.syntax.root.get(), &report.semantic);

    report.success = report.syntax.errors.empty() && report.semantic.errors.empty();

    if (!report.syntax.errors.empty()) {
        report.error = runtime::Tr(options.language, "Errores de sintaxis: ", "syntax errors: ") +
                       JoinBracketed(report.syntax.errors);
    } else if (!report.semantic.errors.empty()) {
        report.error = runtime::Tr(options.language, "Errores semánticos: ", "semantic errors: ") +
                       JoinBracketed(report.semantic.errors);
    }

    return report;
}

}  // namespace pycheck::analysis
