#pragma once

namespace gcl {

// Forward declarations
class Block;
class Assignment;
class PrintStatement;
class SkipStatement;
class IfStatement;
class WhileLoop;

class Literal;
class Identifier;
class BinaryOp;
class UnaryOp;
class ApplyExpression;
class FunctionUpdate;

// Every pass implements every node kind, so adding a node breaks the build of
// each pass that does not handle it.
class Visitor {
public:
    virtual ~Visitor() = default;

    // Instructions
    virtual void visit(const Block& node) = 0;
    virtual void visit(const Assignment& node) = 0;
    virtual void visit(const PrintStatement& node) = 0;
    virtual void visit(const SkipStatement& node) = 0;
    virtual void visit(const IfStatement& node) = 0;
    virtual void visit(const WhileLoop& node) = 0;

    // Expressions
    virtual void visit(const Literal& node) = 0;
    virtual void visit(const Identifier& node) = 0;
    virtual void visit(const BinaryOp& node) = 0;
    virtual void visit(const UnaryOp& node) = 0;
    virtual void visit(const ApplyExpression& node) = 0;
    virtual void visit(const FunctionUpdate& node) = 0;
};

} // namespace gcl
