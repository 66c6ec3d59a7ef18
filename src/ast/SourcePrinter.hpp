#pragma once

#include "ASTNode.hpp"
#include "Visitor.hpp"
#include <string>

namespace gcl {

// Prints an AST back as GCL source. Every compound expression is
// parenthesised, so re-parsing the output gives the same tree.
class SourcePrinter : public Visitor {
public:
    std::string print(const Block& root);

    void visit(const Block& node) override;
    void visit(const Assignment& node) override;
    void visit(const PrintStatement& node) override;
    void visit(const SkipStatement& node) override;
    void visit(const IfStatement& node) override;
    void visit(const WhileLoop& node) override;

    void visit(const Literal& node) override;
    void visit(const Identifier& node) override;
    void visit(const BinaryOp& node) override;
    void visit(const UnaryOp& node) override;
    void visit(const ApplyExpression& node) override;
    void visit(const FunctionUpdate& node) override;

private:
    std::string out;
    int indent = 0;

    void newline();
    void instructions(const InstructionList& list);
    void guards(const GuardList& list);
};

} // namespace gcl
