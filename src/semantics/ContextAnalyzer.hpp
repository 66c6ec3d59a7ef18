#pragma once

#include "../ast/Visitor.hpp"
#include "../ast/ASTNode.hpp"
#include "Scope.hpp"
#include "../types/Type.hpp"
#include "../diagnostics/Diagnostic.hpp"
#include <string>

namespace gcl {

class DiagnosticEngine;

// Resolves names, checks types and annotates the AST in place. Errors are
// accumulated: analysis always walks the whole tree, and an expression that
// fails to type gets a null type so that its parents stay silent.
class ContextAnalyzer : public Visitor {
public:
    bool hasError = false;

    // `maxDepth` bounds the nesting of blocks, guarded statements and
    // expressions; deeper programs get one DepthExceeded diagnostic.
    ContextAnalyzer(DiagnosticEngine& diag, bool debug = false, int maxDepth = 1000);
    ~ContextAnalyzer();

    ContextAnalyzer(const ContextAnalyzer&) = delete;
    ContextAnalyzer& operator=(const ContextAnalyzer&) = delete;

    // True when the program is well formed.
    bool analyze(const Block& program);

    // Number of storage slots handed out so far.
    int slotCount() const { return nextSlot; }

    // --- Instructions ---
    void visit(const Block& node) override;
    void visit(const Assignment& node) override;
    void visit(const PrintStatement& node) override;
    void visit(const SkipStatement& node) override;
    void visit(const IfStatement& node) override;
    void visit(const WhileLoop& node) override;

    // --- Expressions ---
    void visit(const Literal& node) override;
    void visit(const Identifier& node) override;
    void visit(const BinaryOp& node) override;
    void visit(const UnaryOp& node) override;
    void visit(const ApplyExpression& node) override;
    void visit(const FunctionUpdate& node) override;

private:
    struct NestingGuard {
        ContextAnalyzer& analyzer;
        bool ok;
        NestingGuard(ContextAnalyzer& a, const ASTNode& node);
        ~NestingGuard() { analyzer.depth--; }
        explicit operator bool() const { return ok; }
    };

    DiagnosticEngine& diag;
    bool debug;
    int maxDepth;
    int depth = 0;
    bool depthReported = false;
    Scope* currentScope;
    int blockDepth = 0;
    int nextSlot = 0;

    // Type of the expression visited last
    TypePtr lastExprType;

    void enterScope();
    void exitScope();

    void declare(const Declaration& decl, const Block& owner);
    TypePtr resolveTypeFromAST(const TypeNode& node);
    TypePtr typeOf(const Expression& expr);

    void analyzeGuards(const GuardList& guards, const char* construct);
    void checkLiteralIndex(const Expression& function, const Expression& index);
    std::string suggestName(const std::string& name) const;

    void error(const ASTNode& node, DiagnosticKind kind, const std::string& msg,
               const std::string& subject = "", const std::string& help = "");
};

} // namespace gcl
