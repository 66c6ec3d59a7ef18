#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../ast/Visitor.hpp"
#include "../ast/ASTNode.hpp"
#include "../lambda/LambdaExpr.hpp"
#include "../diagnostics/Diagnostic.hpp"

namespace gcl {

class DiagnosticEngine;

struct TranslatorOptions {
    int maxDepth = 256;           // nesting limit over instructions and expressions
    unsigned maxNumeral = 100000; // largest integer literal
    bool debug = false;
};

struct Translation {
    lambda::TermPtr transformer;  // state -> final configuration
    lambda::TermPtr initialState; // one entry per slot
    lambda::TermPtr program;      // transformer applied to initialState
    int slotCount = 0;
};

// Turns an analyzed AST into a Lambda term. Instructions become
// configuration transformers, expressions become functions of the state.
// Stops at the first error.
class Translator : public Visitor {
public:
    bool failed = false;

    Translator(DiagnosticEngine& diag, TranslatorOptions options = {});

    std::optional<Translation> translate(const Block& program, int slotCount);

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
    // Counts nesting for the lifetime of one visit; false once the limit
    // is passed or translation already failed.
    struct DepthGuard {
        Translator& translator;
        bool ok;
        DepthGuard(Translator& t, const ASTNode& node);
        ~DepthGuard() { translator.depth--; }
        explicit operator bool() const { return ok; }
    };

    DiagnosticEngine& diag;
    TranslatorOptions options;
    int depth = 0;
    int loopCounter = 0;

    // Term produced by the node visited last
    lambda::TermPtr lastTerm;

    lambda::TermPtr instruction(const Instruction& node);
    lambda::TermPtr sequence(const InstructionList& list);
    lambda::TermPtr sequence(std::vector<lambda::TermPtr> steps);

    // Body over the state variable `s`, and its abstraction λs.body
    lambda::TermPtr expression(const Expression& node);
    lambda::TermPtr stateFunction(const Expression& node);

    lambda::TermPtr guardChain(const GuardList& guards, lambda::TermPtr fallback,
                               const lambda::TermPtr& loop);
    lambda::TermPtr showAsString(const Expression& node);
    lambda::TermPtr equality(const Expression& left);
    lambda::TermPtr defaultValue(const TypePtr& type, const ASTNode& where);
    lambda::TermPtr integer(unsigned long long value, const ASTNode& where);

    void fail(const ASTNode& node, DiagnosticKind kind, const std::string& msg);
};

} // namespace gcl
