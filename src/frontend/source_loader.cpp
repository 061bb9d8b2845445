#include "pycheck/frontend/source_loader.hpp"

#include <fstream>
#include <iterator>

namespace pycheck::frontend {

bool LoadSourceText(
    const std::string& file_path,
    runtime::Language language,
    std::string* out_text,
    std::string* out_error) {
    if (out_text == nullptr || out_error == nullptr) {
        return false;
    }

    std::ifstream input(file_path, std::ios::binary);
    if (!input.is_open()) {
        *out_error = runtime::Tr(language, "No se pudo abrir el archivo: ", "Could not open file: ") + file_path;
        return false;
    }

    return ReadSourceText(input, file_path, language, out_text, out_error);
}

bool ReadSourceText(
    std::istream& input,
    const std::string& display_name,
    runtime::Language language,
    std::string* out_text,
    std::string* out_error) {
    if (out_text == nullptr || out_error == nullptr) {
        return false;
    }

    out_text->assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());

    if (input.bad()) {
        *out_error = runtime::Tr(language, "Error leyendo el archivo: ", "Error reading file: ") + display_name;
        return false;
    }

    return true;
}

}  // namespace pycheck::frontend
