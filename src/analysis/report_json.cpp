#include "pycheck/analysis/report_json.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <llvm/Support/JSON.h>

namespace pycheck::analysis {

namespace {

// Attributes are written in byte order of their keys, the order llvm::json
// uses when it prints an object, so the text does not depend on how the
// report was produced.

std::int64_t Count(std::size_t value) {
    return static_cast<std::int64_t>(value);
}

void WriteText(llvm::json::OStream& json, const std::string& text) {
    if (llvm::json::isUTF8(text)) {
        json.value(llvm::StringRef(text));
    } else {
        json.value(llvm::json::fixUTF8(text));
    }
}

void WriteTextAttribute(llvm::json::OStream& json, llvm::StringRef key, const std::string& text) {
    json.attributeBegin(key);
    WriteText(json, text);
    json.attributeEnd();
}

void WriteTextArray(llvm::json::OStream& json, llvm::StringRef key, const std::vector<std::string>& values) {
    json.attributeArray(key, [&] {
        for (const auto& value : values) {
            WriteText(json, value);
        }
    });
}

void WriteDiagnostics(
    llvm::json::OStream& json,
    llvm::StringRef key,
    const std::vector<frontend::Diagnostic>& diagnostics) {
    json.attributeArray(key, [&] {
        for (const auto& diagnostic : diagnostics) {
            WriteText(json, diagnostic.message);
        }
    });
}

void WriteLexical(llvm::json::OStream& json, const frontend::LexicalReport& lexical) {
    json.object([&] {
        WriteDiagnostics(json, "errors", lexical.errors);
        json.attribute("reserved_words", Count(lexical.reserved_words));

        const frontend::TokenStatistics& stats = lexical.statistics;
        json.attributeObject("statistics", [&] {
            json.attribute("errors", Count(stats.errors));
            json.attribute("identifiers", Count(stats.identifiers));
            json.attribute("keywords", Count(stats.keywords));
            json.attribute("numbers", Count(stats.numbers));
            json.attribute("strings", Count(stats.strings));
            json.attribute("symbols", Count(stats.symbols));
        });

        json.attributeObject("table", [&] {
            WriteTextArray(json, "Error", lexical.table.errors);
            WriteTextArray(json, "ID", lexical.table.identifiers);
            WriteTextArray(json, "Numeros", lexical.table.numbers);
            WriteTextArray(json, "PR", lexical.table.reserved_words);
            WriteTextArray(json, "Simbolos", lexical.table.symbols);
        });

        json.attributeArray("tokens", [&] {
            for (const auto& token : lexical.tokens) {
                json.object([&] {
                    json.attribute("column", Count(token.column));
                    json.attribute("line", Count(token.line));
                    json.attribute("type", static_cast<std::int64_t>(token.kind));
                    WriteTextAttribute(json, "value", token.text);
                });
            }
        });
    });
}

void WriteSyntaxNode(llvm::json::OStream& json, const frontend::SyntaxNode& node) {
    json.object([&] {
        if (!node.children.empty()) {
            json.attributeArray("children", [&] {
                for (const auto& child : node.children) {
                    WriteSyntaxNode(json, *child);
                }
            });
        }
        json.attribute("line", Count(node.line));
        json.attribute("type", frontend::ToString(node.Kind()));

        const std::string value = node.Value();
        if (!value.empty()) {
            WriteTextAttribute(json, "value", value);
        }
    });
}

void WriteSyntax(llvm::json::OStream& json, const frontend::SyntaxResult& syntax) {
    json.object([&] {
        json.attributeBegin("ast");
        if (syntax.root != nullptr) {
            WriteSyntaxNode(json, *syntax.root);
        } else {
            json.value(nullptr);
        }
        json.attributeEnd();

        if (syntax.error_line != 0) {
            json.attribute("error_line", Count(syntax.error_line));
        }
        WriteDiagnostics(json, "errors", syntax.errors);
        json.attribute("success", syntax.success);
    });
}

void WriteSemantic(llvm::json::OStream& json, const frontend::SemanticReport& semantic) {
    json.object([&] {
        WriteDiagnostics(json, "errors", semantic.errors);
        json.attribute("success", semantic.success);
        WriteDiagnostics(json, "type_mismatches", semantic.type_mismatches);

        // VariableTable is a std::map, already in key order.
        json.attributeObject("variables", [&] {
            for (const auto& [name, variable] : semantic.variables) {
                json.attributeObject(name, [&] {
                    json.attribute("line", Count(variable.line));
                    WriteTextAttribute(json, "name", variable.name);
                    json.attribute("type", frontend::ToString(variable.type));
                });
            }
        });
    });
}

}  // namespace

void WriteReportJson(const Report& report, bool pretty, llvm::raw_ostream& out) {
    llvm::json::OStream json(out, pretty ? 2 : 0);
    json.object([&] {
        if (!report.error.empty()) {
            WriteTextAttribute(json, "error", report.error);
        }

        json.attributeBegin("lexical_analysis");
        WriteLexical(json, report.lexical);
        json.attributeEnd();

        json.attributeBegin("semantic_analysis");
        WriteSemantic(json, report.semantic);
        json.attributeEnd();

        json.attribute("success", report.success);

        json.attributeBegin("syntax_analysis");
        WriteSyntax(json, report.syntax);
        json.attributeEnd();
    });
}

std::string FormatReportJson(const Report& report, bool pretty) {
    std::string text;
    llvm::raw_string_ostream stream(text);
    WriteReportJson(report, pretty, stream);
    stream.flush();
    return text;
}

}  // namespace pycheck::analysis
