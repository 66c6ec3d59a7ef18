#include "../ContextAnalyzer.hpp"
#include "../../diagnostics/DiagnosticEngine.hpp"
#include <fmt/core.h>
#include <fmt/color.h>

namespace gcl {

void ContextAnalyzer::visit(const Block& node) {
    NestingGuard guard(*this, node);
    if (!guard) return;

    enterScope();
    node.symbols.clear();

    // All declarations are visible before the first instruction
    for (auto& decl : node.declarations) declare(*decl, node);
    for (auto& instr : node.instructions) instr->accept(*this);

    exitScope();
}

void ContextAnalyzer::declare(const Declaration& decl, const Block& owner) {
    auto type = resolveTypeFromAST(*decl.type);

    for (const auto& declared : decl.names) {
        if (const Symbol* previous = currentScope->resolveLocal(declared.name)) {
            Diagnostic d;
            d.stage = DiagnosticStage::Semantic;
            d.kind = DiagnosticKind::Redeclaration;
            d.message = fmt::format("'{}' is already declared in this block", declared.name);
            d.line = declared.line;
            d.column = declared.column;
            d.subject = declared.name;
            d.length = static_cast<int>(declared.name.size());
            d.help = fmt::format("Previous declaration at {}:{}", previous->line, previous->column);
            diag.report(std::move(d));
            hasError = true;
            continue;
        }

        Symbol sym{declared.name, type, nextSlot++, blockDepth, declared.line, declared.column};
        currentScope->define(sym);
        owner.symbols.push_back(sym);

        if (debug) {
            fmt::print(fg(fmt::color::gray), "[DEBUG] Declared '{}' : {} (slot {}, depth {})\n",
                       sym.name, type->toString(), sym.slot, sym.depth);
        }
    }
}

} // namespace gcl
