#include "pycheck/frontend/ast.hpp"

namespace pycheck::frontend {

bool ParseBinaryOperator(const std::string& text, BinaryOperator* out_op) {
    if (out_op == nullptr) {
        return false;
    }

    if (text == ">") {
        *out_op = BinaryOperator::Greater;
    } else if (text == "<") {
        *out_op = BinaryOperator::Less;
    } else if (text == ">=") {
        *out_op = BinaryOperator::GreaterEqual;
    } else if (text == "<=") {
        *out_op = BinaryOperator::LessEqual;
    } else if (text == "==") {
        *out_op = BinaryOperator::Equal;
    } else if (text == "!=") {
        *out_op = BinaryOperator::NotEqual;
    } else if (text == "+") {
        *out_op = BinaryOperator::Add;
    } else if (text == "-") {
        *out_op = BinaryOperator::Subtract;
    } else if (text == "*") {
        *out_op = BinaryOperator::Multiply;
    } else if (text == "/") {
        *out_op = BinaryOperator::Divide;
    } else {
        return false;
    }
    return true;
}

const char* ToString(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Greater:
        return ">";
    case BinaryOperator::Less:
        return "<";
    case BinaryOperator::GreaterEqual:
        return ">=";
    case BinaryOperator::LessEqual:
        return "<=";
    case BinaryOperator::Equal:
        return "==";
    case BinaryOperator::NotEqual:
        return "!=";
    case BinaryOperator::Add:
        return "+";
    case BinaryOperator::Subtract:
        return "-";
    case BinaryOperator::Multiply:
        return "*";
    case BinaryOperator::Divide:
        return "/";
    }
    return "?";
}

const char* ToString(NodeKind kind) {
    switch (kind) {
    case NodeKind::Program:
        return "Program";
    case NodeKind::FunctionDef:
        return "FunctionDef";
    case NodeKind::IfStatement:
        return "IfStatement";
    case NodeKind::Block:
        return "Block";
    case NodeKind::Assignment:
        return "Assignment";
    case NodeKind::ExpressionStatement:
        return "ExpressionStatement";
    case NodeKind::BinaryOp:
        return "BinaryOp";
    case NodeKind::FunctionCall:
        return "FunctionCall";
    case NodeKind::MethodCall:
        return "MethodCall";
    case NodeKind::Identifier:
        return "Identifier";
    case NodeKind::Number:
        return "Number";
    case NodeKind::String:
        return "String";
    case NodeKind::Parameter:
        return "Parameter";
    }
    return "Unknown";
}

bool IsRelational(BinaryOperator op) {
    return op == BinaryOperator::Greater ||
           op == BinaryOperator::Less ||
           op == BinaryOperator::GreaterEqual ||
           op == BinaryOperator::LessEqual;
}

bool IsEquality(BinaryOperator op) {
    return op == BinaryOperator::Equal || op == BinaryOperator::NotEqual;
}

bool IsComparison(BinaryOperator op) {
    return IsRelational(op) || IsEquality(op);
}

bool IsArithmetic(BinaryOperator op) {
    return op == BinaryOperator::Add ||
           op == BinaryOperator::Subtract ||
           op == BinaryOperator::Multiply ||
           op == BinaryOperator::Divide;
}

std::string SyntaxNode::Value() const {
    switch (Kind()) {
    case NodeKind::FunctionDef:
        return As<FunctionDefNode>()->name;
    case NodeKind::Assignment:
        return As<AssignmentNode>()->target;
    case NodeKind::BinaryOp:
        return ToString(As<BinaryOpNode>()->op);
    case NodeKind::FunctionCall:
        return As<FunctionCallNode>()->callee;
    case NodeKind::MethodCall: {
        const auto* call = As<MethodCallNode>();
        return call->object + "." + call->method;
    }
    case NodeKind::Identifier:
        return As<IdentifierNode>()->name;
    case NodeKind::Number:
        return As<NumberNode>()->literal;
    case NodeKind::String:
        return As<StringNode>()->literal;
    case NodeKind::Parameter:
        return As<ParameterNode>()->name;
    case NodeKind::Program:
    case NodeKind::IfStatement:
    case NodeKind::Block:
    case NodeKind::ExpressionStatement:
        break;
    }
    return {};
}

}  // namespace pycheck::frontend
