#ifndef PYCHECK_CLI_CLI_OPTIONS_HPP
#define PYCHECK_CLI_CLI_OPTIONS_HPP

#include <cstddef>
#include <string>

#include "pycheck/frontend/parser.hpp"
#include "pycheck/runtime/i18n.hpp"

namespace pycheck::cli {

struct CliOptions {
    bool show_help = false;
    bool verbose = false;
    bool pretty = true;
    std::string input_path;  // empty: read stdin
    std::size_t max_depth = frontend::kDefaultMaxDepth;
    runtime::Language language = runtime::Language::English;
};

// Messages in out_error use the process-wide language, which --lang updates
// as soon as it is seen.
bool ParseArgs(int argc, const char* const argv[], CliOptions* out_options, std::string* out_error);

void PrintHelp();

}  // namespace pycheck::cli

#endif  // PYCHECK_CLI_CLI_OPTIONS_HPP
