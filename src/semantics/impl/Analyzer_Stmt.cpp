#include "../ContextAnalyzer.hpp"
#include "../../diagnostics/DiagnosticEngine.hpp"
#include "../../types/TypeImpl.hpp"
#include <fmt/core.h>
#include <fmt/color.h>

namespace gcl {

void ContextAnalyzer::visit(const Assignment& node) {
    const Symbol* sym = currentScope->resolve(node.target);
    auto valueType = typeOf(*node.value);

    if (!sym) {
        std::string suggestion = suggestName(node.target);
        error(node, DiagnosticKind::UndeclaredIdentifier,
              fmt::format("Assignment to undeclared variable '{}'", node.target), node.target,
              suggestion.empty() ? "" : fmt::format("Did you mean '{}'?", suggestion));
        return;
    }

    node.slot = sym->slot;
    node.targetType = sym->type;
    if (!valueType) return;

    if (!valueType->isAssignableTo(*sym->type)) {
        // Both sides are functions: only the lengths disagree
        bool lengthOnly = isFunction(valueType) && isFunction(sym->type);
        error(*node.value,
              lengthOnly ? DiagnosticKind::ArityOrRangeMismatch : DiagnosticKind::TypeMismatch,
              fmt::format("Cannot assign a value of type '{}' to '{}' of type '{}'",
                          valueType->toString(), node.target, sym->type->toString()));
    } else if (debug) {
        fmt::print(fg(fmt::color::gray), "[DEBUG] {} := <{}> (slot {})\n",
                   node.target, valueType->toString(), sym->slot);
    }
}

void ContextAnalyzer::visit(const PrintStatement& node) {
    typeOf(*node.expr);
}

void ContextAnalyzer::visit(const SkipStatement&) {}

void ContextAnalyzer::analyzeGuards(const GuardList& guards, const char* construct) {
    for (auto& guard : guards) {
        auto condType = typeOf(*guard->condition);
        if (condType && !isBool(condType)) {
            error(*guard->condition, DiagnosticKind::TypeMismatch,
                  fmt::format("Guard of '{}' must be of type 'bool', found '{}'",
                              construct, condType->toString()));
        }
        for (auto& instr : guard->body) instr->accept(*this);
    }
}

void ContextAnalyzer::visit(const IfStatement& node) {
    NestingGuard guard(*this, node);
    if (!guard) return;
    analyzeGuards(node.guards, "if");
}

void ContextAnalyzer::visit(const WhileLoop& node) {
    NestingGuard guard(*this, node);
    if (!guard) return;
    analyzeGuards(node.guards, "while");
}

} // namespace gcl
