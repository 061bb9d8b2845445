#ifndef PYCHECK_ANALYSIS_PIPELINE_HPP
#define PYCHECK_ANALYSIS_PIPELINE_HPP

#include <cstddef>
#include <string>

#include "pycheck/frontend/parser.hpp"
#include "pycheck/frontend/scanner.hpp"
#include "pycheck/frontend/semantic_checker.hpp"
#include "pycheck/runtime/i18n.hpp"

namespace pycheck::analysis {

struct AnalysisOptions {
    runtime::Language language = runtime::Language::English;
    std::size_t max_depth = frontend::kDefaultMaxDepth;
};

struct Report {
    frontend::LexicalReport lexical;
    frontend::SyntaxResult syntax;
    frontend::SemanticReport semantic;

    // Lexical diagnostics do not affect this flag.
    bool success = false;

    // Summary of the first failing stage; empty on success.
    std::string error;
};

// Scans, parses and checks one source text. Never fails: every stage runs on
// the best-effort output of the previous one.
Report Analyze(const std::string& source, const AnalysisOptions& options = AnalysisOptions());

}  // namespace pycheck::analysis

#endif  // PYCHECK_ANALYSIS_PIPELINE_HPP
