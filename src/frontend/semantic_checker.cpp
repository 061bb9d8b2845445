#include "pycheck/frontend/semantic_checker.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace pycheck::frontend {

namespace {

bool IsExpression(NodeKind kind) {
    switch (kind) {
    case NodeKind::BinaryOp:
    case NodeKind::FunctionCall:
    case NodeKind::MethodCall:
    case NodeKind::Identifier:
    case NodeKind::Number:
    case NodeKind::String:
        return true;
    case NodeKind::Program:
    case NodeKind::FunctionDef:
    case NodeKind::IfStatement:
    case NodeKind::Block:
    case NodeKind::Assignment:
    case NodeKind::ExpressionStatement:
    case NodeKind::Parameter:
        break;
    }
    return false;
}

class CheckerEngine {
public:
    CheckerEngine(const CheckerOptions& options, const std::vector<Token>& tokens, SemanticReport* report)
        : options_(options), report_(report) {
        for (const auto& token : tokens) {
            line_columns_.emplace(token.line, token.column);
        }
    }

    void Check(const SyntaxNode& root) {
        AnalyzeNode(root);
        CollectTypeMismatches();
        report_->success = report_->errors.empty();
    }

private:
    // Only expression levels count against max_depth, the same measure the
    // parser enforces, so a tree it accepts is walked completely.
    void AnalyzeNode(const SyntaxNode& node) {
        const bool expression = IsExpression(node.Kind());
        if (expression && depth_ >= options_.max_depth) {
            ReportDepthExceeded(node.line);
            return;
        }

        if (expression) {
            ++depth_;
        }
        switch (node.Kind()) {
        case NodeKind::Assignment:
            AnalyzeAssignment(node);
            break;
        case NodeKind::IfStatement:
            AnalyzeIfStatement(node);
            break;
        case NodeKind::BinaryOp:
            AnalyzeBinaryOperation(node);
            break;
        case NodeKind::FunctionCall:
        case NodeKind::MethodCall:
            AnalyzeCall(node);
            break;
        case NodeKind::Program:
        case NodeKind::FunctionDef:
        case NodeKind::Block:
        case NodeKind::ExpressionStatement:
        case NodeKind::Identifier:
        case NodeKind::Number:
        case NodeKind::String:
        case NodeKind::Parameter:
            AnalyzeChildren(node);
            break;
        }
        if (expression) {
            --depth_;
        }
    }

    void AnalyzeChildren(const SyntaxNode& node) {
        for (const auto& child : node.children) {
            if (child != nullptr) {
                AnalyzeNode(*child);
            }
        }
    }

    void AnalyzeAssignment(const SyntaxNode& node) {
        if (node.children.empty() || node.children[0] == nullptr) {
            AddError(node.line, "Asignación sin valor", "assignment without value");
            return;
        }

        const SyntaxNode& value = *node.children[0];
        const std::string& name = node.As<AssignmentNode>()->target;
        report_->variables[name] = Variable{name, InferType(value), node.line};

        AnalyzeNode(value);
    }

    void AnalyzeIfStatement(const SyntaxNode& node) {
        if (node.children.empty() || node.children[0] == nullptr) {
            AddError(node.line, "Declaración if sin condición", "if statement without condition");
            return;
        }

        AnalyzeChildren(node);
    }

    void AnalyzeBinaryOperation(const SyntaxNode& node) {
        if (node.children.size() < 2) {
            AddError(node.line, "Operación binaria incompleta", "incomplete binary operation");
            return;
        }

        const SyntaxNode& lhs = *node.children[0];
        const SyntaxNode& rhs = *node.children[1];
        const BinaryOperator op = node.As<BinaryOpNode>()->op;
        const std::string symbol = ToString(op);

        const VariableType lhs_type = InferType(lhs);
        const VariableType rhs_type = InferType(rhs);

        if (IsRelational(op)) {
            if (lhs_type == VariableType::String && rhs_type == VariableType::Int) {
                AddError(
                    node.line,
                    "No se puede comparar string con número usando '" + symbol + "'",
                    "cannot compare string with number using '" + symbol + "'");
            } else if (lhs_type == VariableType::Int && rhs_type == VariableType::String) {
                AddError(
                    node.line,
                    "No se puede comparar número con string usando '" + symbol + "'",
                    "cannot compare number with string using '" + symbol + "'");
            }
        } else if (IsEquality(op)) {
            if (lhs_type == VariableType::String && rhs_type == VariableType::Int) {
                AddError(
                    node.line,
                    "Comparación entre tipos incompatibles: string y número",
                    "comparison between incompatible types: string and number");
            } else if (lhs_type == VariableType::Int && rhs_type == VariableType::String) {
                AddError(
                    node.line,
                    "Comparación entre tipos incompatibles: número y string",
                    "comparison between incompatible types: number and string");
            }
        } else if (IsArithmetic(op)) {
            // '+' on strings is concatenation. '*' and '/' only reach this
            // point once the grammar grows a multiplicative level.
            const bool has_string = lhs_type == VariableType::String || rhs_type == VariableType::String;
            if (has_string && op != BinaryOperator::Add) {
                AddError(
                    node.line,
                    "Operador '" + symbol + "' no válido para strings",
                    "operator '" + symbol + "' is not valid for strings");
            }
        }

        AnalyzeNode(lhs);
        AnalyzeNode(rhs);
    }

    void AnalyzeCall(const SyntaxNode& node) {
        if (const auto* method = node.As<MethodCallNode>()) {
            const auto found = report_->variables.find(method->object);
            if (found == report_->variables.end()) {
                AddError(
                    node.line,
                    "Variable '" + method->object + "' no está definida",
                    "variable '" + method->object + "' is not defined");
            } else if (method->method == "lower" && found->second.type != VariableType::String) {
                AddError(
                    node.line,
                    "El método 'lower()' no está disponible para el tipo de '" + method->object + "'",
                    "method 'lower()' is not available for the type of '" + method->object + "'");
            }
        }

        // print and every other call: arguments only, no arity or type rules.
        AnalyzeChildren(node);
    }

    VariableType InferType(const SyntaxNode& node) const {
        switch (node.Kind()) {
        case NodeKind::Number:
            return VariableType::Int;
        case NodeKind::String:
            return VariableType::String;
        case NodeKind::Identifier: {
            const auto found = report_->variables.find(node.As<IdentifierNode>()->name);
            if (found != report_->variables.end()) {
                return found->second.type;
            }
            return VariableType::Unknown;
        }
        case NodeKind::BinaryOp: {
            if (IsComparison(node.As<BinaryOpNode>()->op)) {
                return VariableType::Bool;
            }
            if (node.children.size() >= 2) {
                const VariableType lhs = InferType(*node.children[0]);
                const VariableType rhs = InferType(*node.children[1]);
                if (lhs == VariableType::Int && rhs == VariableType::Int) {
                    return VariableType::Int;
                }
                if (lhs == VariableType::String || rhs == VariableType::String) {
                    return VariableType::String;
                }
            }
            return VariableType::Unknown;
        }
        case NodeKind::MethodCall:
            if (node.Value().find(".lower") != std::string::npos) {
                return VariableType::String;
            }
            return VariableType::Unknown;
        case NodeKind::Program:
        case NodeKind::FunctionDef:
        case NodeKind::IfStatement:
        case NodeKind::Block:
        case NodeKind::Assignment:
        case NodeKind::ExpressionStatement:
        case NodeKind::FunctionCall:
        case NodeKind::Parameter:
            break;
        }
        return VariableType::Unknown;
    }

    void CollectTypeMismatches() {
        const std::vector<std::string> markers = options_.language == runtime::Language::English
            ? std::vector<std::string>{"compare", "comparison"}
            : std::vector<std::string>{"comparar", "Comparación"};

        for (const auto& error : report_->errors) {
            for (const auto& marker : markers) {
                if (error.message.find(marker) != std::string::npos) {
                    report_->type_mismatches.push_back(error);
                    break;
                }
            }
        }
    }

    void ReportDepthExceeded(std::size_t line) {
        if (depth_reported_) {
            return;
        }
        depth_reported_ = true;

        const std::string limit = std::to_string(options_.max_depth);
        AddError(
            line,
            "Se superó la profundidad máxima de anidamiento (" + limit + ")",
            "maximum nesting depth of " + limit + " exceeded");
    }

    void AddError(std::size_t line, const std::string& spanish, const std::string& english) {
        const auto column = line_columns_.find(line);
        report_->errors.push_back(Diagnostic{
            line,
            column == line_columns_.end() ? 0 : column->second,
            runtime::Tr(
                options_.language,
                "Error semántico en línea " + std::to_string(line) + ": " + spanish,
                "semantic error at line " + std::to_string(line) + ": " + english),
        });
    }

    const CheckerOptions& options_;
    SemanticReport* report_ = nullptr;
    std::unordered_map<std::size_t, std::size_t> line_columns_;
    std::size_t depth_ = 0;
    bool depth_reported_ = false;
};

}  // namespace

const char* ToString(VariableType type) {
    switch (type) {
    case VariableType::Int:
        return "int";
    case VariableType::String:
        return "string";
    case VariableType::Bool:
        return "bool";
    case VariableType::Unknown:
    default:
        return "unknown";
    }
}

SemanticChecker::SemanticChecker(CheckerOptions options) : options_(options) {}

void SemanticChecker::Check(
    const std::vector<Token>& tokens,
    const SyntaxNode* root,
    SemanticReport* out_report) const {
    if (out_report == nullptr) {
        return;
    }

    out_report->errors.clear();
    out_report->variables.clear();
    out_report->type_mismatches.clear();
    out_report->success = true;

    if (root == nullptr) {
        return;
    }

    CheckerEngine engine(options_, tokens, out_report);
    engine.Check(*root);
}

}  // namespace pycheck::frontend
