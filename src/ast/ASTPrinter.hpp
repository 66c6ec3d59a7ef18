#pragma once

#include "ASTNode.hpp"
#include "Visitor.hpp"
#include <fmt/format.h>
#include <string>

namespace gcl {

// Tree dump of an AST, including the annotations of the context analyzer
// (types, slots, block symbols) when present.
class ASTPrinter : public Visitor {
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
    fmt::memory_buffer out;
    std::string prefix;  // marker for the current line
    std::string indent;  // prefix for the children of the current node

    void line(const std::string& text);
    void child(const Expression& node, bool isLast);
    void child(const Instruction& node, bool isLast);
    void label(const std::string& text, bool isLast);
    void guards(const GuardList& list);

    template <typename F>
    void nested(bool isLast, F&& body);
};

} // namespace gcl
