#include "../ContextAnalyzer.hpp"
#include "../../diagnostics/DiagnosticEngine.hpp"
#include "../../utils/Levenshtein.hpp"
#include "../../types/TypeImpl.hpp"
#include <fmt/core.h>
#include <fmt/color.h>

namespace gcl {

ContextAnalyzer::ContextAnalyzer(DiagnosticEngine& d, bool dbg, int limit)
    : diag(d), debug(dbg), maxDepth(limit) {
    currentScope = new Scope(nullptr);
}

ContextAnalyzer::NestingGuard::NestingGuard(ContextAnalyzer& a, const ASTNode& node) : analyzer(a) {
    analyzer.depth++;
    ok = analyzer.depth <= analyzer.maxDepth;
    if (!ok && !analyzer.depthReported) {
        analyzer.depthReported = true;
        analyzer.error(node, DiagnosticKind::DepthExceeded,
                       fmt::format("Program nesting exceeds the analysis limit of {}", analyzer.maxDepth));
    }
}

ContextAnalyzer::~ContextAnalyzer() {
    Scope* s = currentScope;
    while (s) {
        Scope* p = s->parent;
        delete s;
        s = p;
    }
}

bool ContextAnalyzer::analyze(const Block& program) {
    hasError = false;
    depth = 0;
    depthReported = false;
    program.accept(*this);
    if (debug) {
        if (hasError) {
            fmt::print(fg(fmt::color::red), "[DEBUG] Context analysis failed\n");
        } else {
            fmt::print(fg(fmt::color::green), "[DEBUG] Context analysis passed, {} slot(s)\n", nextSlot);
        }
    }
    return !hasError;
}

void ContextAnalyzer::enterScope() {
    currentScope = new Scope(currentScope);
    blockDepth++;
}

void ContextAnalyzer::exitScope() {
    Scope* old = currentScope;
    currentScope = currentScope->parent;
    delete old;
    blockDepth--;
}

TypePtr ContextAnalyzer::resolveTypeFromAST(const TypeNode& node) {
    switch (node.kind) {
        case TypeKind::INT: return intType();
        case TypeKind::BOOL: return boolType();
        case TypeKind::FUNCTION: return std::make_shared<FunctionRangeType>(node.upper);
    }
    return nullptr;
}

TypePtr ContextAnalyzer::typeOf(const Expression& expr) {
    lastExprType = nullptr;
    NestingGuard guard(*this, expr);
    if (!guard) {
        expr.type = nullptr;
        return nullptr;
    }
    expr.accept(*this);
    expr.type = lastExprType;
    return lastExprType;
}

std::string ContextAnalyzer::suggestName(const std::string& name) const {
    int threshold = name.size() < 4 ? 1 : 2;
    return utils::closest_match(name, currentScope->visibleNames(), threshold);
}

void ContextAnalyzer::error(const ASTNode& node, DiagnosticKind kind, const std::string& msg,
                            const std::string& subject, const std::string& help) {
    Diagnostic d;
    d.stage = DiagnosticStage::Semantic;
    d.kind = kind;
    d.message = msg;
    d.line = node.line;
    d.column = node.column;
    d.subject = subject;
    d.length = subject.empty() ? 1 : static_cast<int>(subject.size());
    d.help = help;
    diag.report(std::move(d));
    hasError = true;
}

} // namespace gcl
