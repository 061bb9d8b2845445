#include <cstdlib>
#include <iostream>
#include <string>

#include <llvm/Support/raw_ostream.h>

#include "pycheck/analysis/pipeline.hpp"
#include "pycheck/analysis/report_json.hpp"
#include "pycheck/cli/cli_options.hpp"
#include "pycheck/frontend/source_loader.hpp"
#include "pycheck/runtime/i18n.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitAnalysisErrors = 1;
constexpr int kExitUsage = 2;

void PrintStageSummary(const pycheck::analysis::Report& report) {
    std::cerr << pycheck::runtime::Tr("Lexico: ", "Lexical: ")
              << report.lexical.tokens.size()
              << pycheck::runtime::Tr(" tokens, ", " tokens, ")
              << report.lexical.errors.size()
              << pycheck::runtime::Tr(" errores\n", " errors\n");
    std::cerr << pycheck::runtime::Tr("Sintactico: ", "Syntax: ")
              << report.syntax.errors.size()
              << pycheck::runtime::Tr(" errores\n", " errors\n");
    std::cerr << pycheck::runtime::Tr("Semantico: ", "Semantic: ")
              << report.semantic.errors.size()
              << pycheck::runtime::Tr(" errores, ", " errors, ")
              << report.semantic.variables.size()
              << pycheck::runtime::Tr(" variables\n", " variables\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    pycheck::cli::CliOptions options;

    if (const char* env_lang = std::getenv("PYCHECK_LANG"); env_lang != nullptr) {
        pycheck::runtime::Language parsed_language = pycheck::runtime::Language::English;
        if (pycheck::runtime::ParseLanguage(env_lang, &parsed_language)) {
            options.language = parsed_language;
            pycheck::runtime::SetLanguage(parsed_language);
        }
    }

    std::string cli_error;
    if (!pycheck::cli::ParseArgs(argc, argv, &options, &cli_error)) {
        std::cerr << "Error: " << cli_error << "\n";
        std::cerr << pycheck::runtime::Tr(
                         "Use --help para ver las opciones disponibles.\n",
                         "Use --help to see available options.\n");
        return kExitUsage;
    }

    pycheck::runtime::SetLanguage(options.language);

    if (options.show_help) {
        pycheck::cli::PrintHelp();
        return kExitSuccess;
    }

    std::string source;
    std::string load_error;
    const bool loaded = options.input_path.empty() || options.input_path == "-"
        ? pycheck::frontend::ReadSourceText(std::cin, "<stdin>", options.language, &source, &load_error)
        : pycheck::frontend::LoadSourceText(options.input_path, options.language, &source, &load_error);
    if (!loaded) {
        std::cerr << "Error: " << load_error << "\n";
        return kExitUsage;
    }

    pycheck::analysis::AnalysisOptions analysis_options;
    analysis_options.language = options.language;
    analysis_options.max_depth = options.max_depth;
    const pycheck::analysis::Report report = pycheck::analysis::Analyze(source, analysis_options);

    if (options.verbose) {
        PrintStageSummary(report);
    }

    pycheck::analysis::WriteReportJson(report, options.pretty, llvm::outs());
    llvm::outs() << "\n";
    llvm::outs().flush();

    return report.success ? kExitSuccess : kExitAnalysisErrors;
}
