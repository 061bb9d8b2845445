#include "pycheck/cli/cli_options.hpp"

#include <cctype>
#include <iostream>
#include <string>

namespace pycheck::cli {

namespace {

bool ParseDepth(const std::string& text, std::size_t* out_depth) {
    if (text.empty() || text.size() > 6) {
        return false;
    }
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }

    const std::size_t depth = static_cast<std::size_t>(std::stoul(text));
    if (depth == 0) {
        return false;
    }
    *out_depth = depth;
    return true;
}

}  // namespace

void PrintHelp() {
    if (runtime::GetLanguage() == runtime::Language::English) {
        std::cout
            << "pycheck\n"
            << "Usage:\n"
            << "  pycheck [file.py] [options]\n\n"
            << "Options:\n"
            << "  -h, --help           Show this help\n"
            << "  --lang en|es         Diagnostic language (English/Spanish)\n"
            << "  --max-depth <n>      Nesting ceiling for parsing and checking (default "
            << frontend::kDefaultMaxDepth << ")\n"
            << "  --compact            Print the report on a single line\n"
            << "  --verbose            Print a summary of each stage on stderr\n\n"
            << "Without a file the source is read from standard input.\n"
            << "Exit status: 0 when the analysis succeeds, 1 when it reports errors, 2 on usage errors.\n";
        return;
    }

    std::cout
        << "pycheck\n"
        << "Uso:\n"
        << "  pycheck [archivo.py] [opciones]\n\n"
        << "Opciones:\n"
        << "  -h, --help           Muestra esta ayuda\n"
        << "  --lang en|es         Idioma de los diagnosticos\n"
        << "  --max-depth <n>      Limite de anidamiento para el analisis (por defecto "
        << frontend::kDefaultMaxDepth << ")\n"
        << "  --compact            Imprime el reporte en una sola linea\n"
        << "  --verbose            Imprime un resumen de cada etapa en stderr\n\n"
        << "Sin archivo, el codigo se lee de la entrada estandar.\n"
        << "Codigo de salida: 0 si el analisis es correcto, 1 si reporta errores, 2 ante errores de uso.\n";
}

bool ParseArgs(int argc, const char* const argv[], CliOptions* out_options, std::string* out_error) {
    if (out_options == nullptr || out_error == nullptr) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            out_options->show_help = true;
            continue;
        }

        if (arg == "--verbose") {
            out_options->verbose = true;
            continue;
        }

        if (arg == "--compact") {
            out_options->pretty = false;
            continue;
        }

        if (arg == "--lang") {
            if (i + 1 >= argc) {
                *out_error = runtime::Tr("Falta valor para --lang.", "Missing value for --lang.");
                return false;
            }

            runtime::Language parsed_language = runtime::Language::English;
            if (!runtime::ParseLanguage(argv[++i], &parsed_language)) {
                *out_error = runtime::Tr("Idioma invalido. Use es o en.", "Invalid language. Use es or en.");
                return false;
            }

            out_options->language = parsed_language;
            runtime::SetLanguage(parsed_language);
            continue;
        }

        if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                *out_error = runtime::Tr("Falta valor para --max-depth.", "Missing value for --max-depth.");
                return false;
            }

            const std::string value = argv[++i];
            if (!ParseDepth(value, &out_options->max_depth)) {
                *out_error = runtime::Tr("Profundidad invalida: ", "Invalid depth: ") + value;
                return false;
            }
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            *out_error = runtime::Tr("Opcion desconocida: ", "Unknown option: ") + arg;
            return false;
        }

        if (out_options->input_path.empty()) {
            out_options->input_path = arg;
        } else {
            *out_error = runtime::Tr(
                "Se recibieron multiples archivos de entrada.",
                "Multiple input files were provided.");
            return false;
        }
    }

    return true;
}

}  // namespace pycheck::cli
