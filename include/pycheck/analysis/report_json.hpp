#ifndef PYCHECK_ANALYSIS_REPORT_JSON_HPP
#define PYCHECK_ANALYSIS_REPORT_JSON_HPP

#include <string>

#include <llvm/Support/raw_ostream.h>

#include "pycheck/analysis/pipeline.hpp"

namespace pycheck::analysis {

// Streams the report without building it in memory first. Keys come out in
// sorted order, so equal reports give equal text.
void WriteReportJson(const Report& report, bool pretty, llvm::raw_ostream& out);
std::string FormatReportJson(const Report& report, bool pretty);

}  // namespace pycheck::analysis

#endif  // PYCHECK_ANALYSIS_REPORT_JSON_HPP
