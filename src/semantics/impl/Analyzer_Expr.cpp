#include "../ContextAnalyzer.hpp"
#include "../../diagnostics/DiagnosticEngine.hpp"
#include "../../types/TypeImpl.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace gcl {

namespace {

// Value of an integer literal, possibly negated; false for anything else.
bool literalValue(const Expression& expr, long long& out) {
    if (auto* lit = dynamic_cast<const Literal*>(&expr)) {
        if (lit->kind != ASTTokenKind::INTEGER) return false;
        out = std::strtoll(lit->value.c_str(), nullptr, 10);
        return true;
    }
    if (auto* un = dynamic_cast<const UnaryOp*>(&expr)) {
        if (un->op == ASTTokenKind::MINUS && literalValue(*un->operand, out)) {
            out = -out;
            return true;
        }
    }
    return false;
}

bool isPrintable(const TypePtr& t) {
    return isInt(t) || isBool(t) || isString(t);
}

} // namespace

void ContextAnalyzer::visit(const Literal& node) {
    switch (node.kind) {
        case ASTTokenKind::INTEGER: lastExprType = intType(); break;
        case ASTTokenKind::BOOL: lastExprType = boolType(); break;
        case ASTTokenKind::STRING_LITERAL: lastExprType = stringType(); break;
        default: lastExprType = nullptr;
    }
}

void ContextAnalyzer::visit(const Identifier& node) {
    const Symbol* sym = currentScope->resolve(node.name);
    if (!sym) {
        std::string suggestion = suggestName(node.name);
        error(node, DiagnosticKind::UndeclaredIdentifier,
              fmt::format("Use of undeclared variable '{}'", node.name), node.name,
              suggestion.empty() ? "" : fmt::format("Did you mean '{}'?", suggestion));
        lastExprType = nullptr;
        return;
    }
    node.slot = sym->slot;
    lastExprType = sym->type;
}

void ContextAnalyzer::visit(const BinaryOp& node) {
    auto leftType = typeOf(*node.left);
    auto rightType = typeOf(*node.right);

    lastExprType = nullptr;
    if (!leftType || !rightType) return;

    auto mismatch = [&]() {
        error(node, DiagnosticKind::TypeMismatch,
              fmt::format("Operator '{}' cannot be applied to '{}' and '{}'",
                          astTokenKindToString(node.op), leftType->toString(), rightType->toString()),
              astTokenKindToString(node.op));
    };

    switch (node.op) {
        case ASTTokenKind::PLUS:
            if (isString(leftType) || isString(rightType)) {
                // Concatenation
                if (isPrintable(leftType) && isPrintable(rightType)) lastExprType = stringType();
                else mismatch();
                return;
            }
            [[fallthrough]];
        case ASTTokenKind::MINUS:
        case ASTTokenKind::MULT:
            if (isInt(leftType) && isInt(rightType)) lastExprType = intType();
            else mismatch();
            return;

        case ASTTokenKind::AND:
        case ASTTokenKind::OR:
            if (isBool(leftType) && isBool(rightType)) lastExprType = boolType();
            else mismatch();
            return;

        case ASTTokenKind::LT:
        case ASTTokenKind::LTEQ:
        case ASTTokenKind::GT:
        case ASTTokenKind::GTEQ:
            if (isInt(leftType) && isInt(rightType)) lastExprType = boolType();
            else mismatch();
            return;

        case ASTTokenKind::EQEQ:
        case ASTTokenKind::NOTEQ:
            if (leftType->isComparableWith(*rightType)) lastExprType = boolType();
            else mismatch();
            return;

        case ASTTokenKind::COMMA: {
            auto* leftLit = leftType->as<FunctionLiteralType>();
            auto* rightLit = rightType->as<FunctionLiteralType>();
            if (isInt(leftType) && isInt(rightType)) {
                lastExprType = std::make_shared<FunctionLiteralType>(2);
            } else if (leftLit && isInt(rightType)) {
                lastExprType = std::make_shared<FunctionLiteralType>(leftLit->size + 1);
            } else if (isInt(leftType) && rightLit) {
                lastExprType = std::make_shared<FunctionLiteralType>(rightLit->size + 1);
            } else {
                mismatch();
            }
            return;
        }

        default:
            mismatch();
    }
}

void ContextAnalyzer::visit(const UnaryOp& node) {
    auto operandType = typeOf(*node.operand);
    lastExprType = nullptr;
    if (!operandType) return;

    TypePtr expected = node.op == ASTTokenKind::NOT ? boolType() : intType();
    if (operandType->equals(*expected)) {
        lastExprType = expected;
    } else {
        error(node, DiagnosticKind::TypeMismatch,
              fmt::format("Operator '{}' expects '{}', found '{}'",
                          astTokenKindToString(node.op), expected->toString(), operandType->toString()),
              astTokenKindToString(node.op));
    }
}

void ContextAnalyzer::checkLiteralIndex(const Expression& function, const Expression& index) {
    long long value = 0;
    if (!function.type || !literalValue(index, value)) return;
    int length = functionLength(*function.type);
    if (length < 0) return;
    if (value < 0 || value >= length) {
        error(index, DiagnosticKind::ArityOrRangeMismatch,
              fmt::format("Index {} is outside the range [0..{}] of '{}'",
                          value, length - 1, function.type->toString()));
        lastExprType = nullptr;
    }
}

void ContextAnalyzer::visit(const ApplyExpression& node) {
    auto fnType = typeOf(*node.function);
    auto indexType = typeOf(*node.index);

    lastExprType = nullptr;
    if (!fnType || !indexType) return;

    if (!isFunction(fnType)) {
        error(*node.function, DiagnosticKind::TypeMismatch,
              fmt::format("Only functions can be applied, found '{}'", fnType->toString()));
        return;
    }
    if (!isInt(indexType)) {
        error(*node.index, DiagnosticKind::TypeMismatch,
              fmt::format("Function index must be 'int', found '{}'", indexType->toString()));
        return;
    }
    lastExprType = intType();
    checkLiteralIndex(*node.function, *node.index);
}

void ContextAnalyzer::visit(const FunctionUpdate& node) {
    auto fnType = typeOf(*node.function);
    auto indexType = typeOf(*node.index);
    auto valueType = typeOf(*node.value);

    lastExprType = nullptr;
    if (!fnType || !indexType || !valueType) return;

    if (!isFunction(fnType)) {
        error(*node.function, DiagnosticKind::TypeMismatch,
              fmt::format("Only functions can be updated, found '{}'", fnType->toString()));
        return;
    }
    if (!isInt(indexType)) {
        error(*node.index, DiagnosticKind::TypeMismatch,
              fmt::format("Function index must be 'int', found '{}'", indexType->toString()));
        return;
    }
    if (!isInt(valueType)) {
        error(*node.value, DiagnosticKind::TypeMismatch,
              fmt::format("Function values must be 'int', found '{}'", valueType->toString()));
        return;
    }
    lastExprType = fnType;
    checkLiteralIndex(*node.function, *node.index);
}

} // namespace gcl
