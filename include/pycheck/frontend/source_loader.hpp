#ifndef PYCHECK_FRONTEND_SOURCE_LOADER_HPP
#define PYCHECK_FRONTEND_SOURCE_LOADER_HPP

#include <istream>
#include <string>

#include "pycheck/runtime/i18n.hpp"

namespace pycheck::frontend {

bool LoadSourceText(
    const std::string& file_path,
    runtime::Language language,
    std::string* out_text,
    std::string* out_error);

bool ReadSourceText(
    std::istream& input,
    const std::string& display_name,
    runtime::Language language,
    std::string* out_text,
    std::string* out_error);

}  // namespace pycheck::frontend

#endif  // PYCHECK_FRONTEND_SOURCE_LOADER_HPP
