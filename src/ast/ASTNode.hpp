#pragma once

#include <string>
#include <vector>
#include <memory>
#include "Visitor.hpp"
#include "../types/Type.hpp"
#include "../semantics/Symbol.hpp"

namespace gcl {

enum class ASTTokenKind {
    INTEGER, BOOL, STRING_LITERAL,
    PLUS, MINUS, MULT,
    AND, OR, NOT,
    EQEQ, NOTEQ, LT, GT, LTEQ, GTEQ,
    COMMA
};

// Source spelling of an operator ("+", "and", "<>", ...).
const char* astTokenKindToString(ASTTokenKind k);

class ASTNode {
public:
    int line = 0;
    int column = 0;
    virtual ~ASTNode() = default;
    template<typename Loc> void setLoc(const Loc& loc) {
        line = loc.begin.line;
        column = loc.begin.column;
    }

protected:
    using NodeStack = std::vector<std::unique_ptr<ASTNode>>;

    // Moves the owned children into `out`.
    virtual void releaseChildren(NodeStack& out) { (void)out; }

    // Frees the subtree with an explicit stack. Every node owning children
    // calls this from its destructor so deep trees never recurse.
    void dismantle();
};

class Expression : public ASTNode {
public:
    // Set by the context analyzer; null until analyzed or when ill-typed.
    mutable TypePtr type;
    virtual void accept(Visitor& v) const = 0;
};

class Instruction : public ASTNode {
public:
    virtual void accept(Visitor& v) const = 0;
};

using ExprPtr = std::unique_ptr<Expression>;
using InstrPtr = std::unique_ptr<Instruction>;
using InstructionList = std::vector<InstrPtr>;

// --- Types ---
enum class TypeKind { INT, BOOL, FUNCTION };

class TypeNode : public ASTNode {
public:
    TypeKind kind;
    int upper = 0; // N in function[..N]
    TypeNode(TypeKind k, int n = 0);
    std::string toString() const;
};

struct DeclaredName {
    std::string name;
    int line = 0;
    int column = 0;
};

class Declaration : public ASTNode {
public:
    std::unique_ptr<TypeNode> type;
    std::vector<DeclaredName> names;
    Declaration(std::unique_ptr<TypeNode> t, std::vector<DeclaredName> n);
};

// --- Expressions ---
class Literal : public Expression {
public:
    std::string value; // decimal digits, "true"/"false", or the unescaped string
    ASTTokenKind kind;
    Literal(std::string v, ASTTokenKind k);
    void accept(Visitor& v) const override;
};

class Identifier : public Expression {
public:
    std::string name;
    mutable int slot = -1;
    Identifier(std::string n);
    void accept(Visitor& v) const override;
};

class BinaryOp : public Expression {
public:
    ExprPtr left;
    ASTTokenKind op;
    ExprPtr right;
    BinaryOp(ExprPtr l, ASTTokenKind o, ExprPtr r);
    void accept(Visitor& v) const override;
    ~BinaryOp() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

class UnaryOp : public Expression {
public:
    ASTTokenKind op;
    ExprPtr operand;
    UnaryOp(ASTTokenKind o, ExprPtr e);
    void accept(Visitor& v) const override;
    ~UnaryOp() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

// f.i
class ApplyExpression : public Expression {
public:
    ExprPtr function;
    ExprPtr index;
    ApplyExpression(ExprPtr f, ExprPtr i);
    void accept(Visitor& v) const override;
    ~ApplyExpression() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

// f(i:v), also written f[i:v]
class FunctionUpdate : public Expression {
public:
    ExprPtr function;
    ExprPtr index;
    ExprPtr value;
    FunctionUpdate(ExprPtr f, ExprPtr i, ExprPtr v);
    void accept(Visitor& v) const override;
    ~FunctionUpdate() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

// --- Instructions ---
class Block : public Instruction {
public:
    std::vector<std::unique_ptr<Declaration>> declarations;
    InstructionList instructions;
    // Symbols this block declares, in declaration order.
    mutable std::vector<Symbol> symbols;
    Block(std::vector<std::unique_ptr<Declaration>> d, InstructionList i);
    void accept(Visitor& v) const override;
    ~Block() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

class Assignment : public Instruction {
public:
    std::string target;
    ExprPtr value;
    mutable int slot = -1;
    mutable TypePtr targetType;
    Assignment(std::string t, ExprPtr v);
    void accept(Visitor& v) const override;
    ~Assignment() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

class PrintStatement : public Instruction {
public:
    ExprPtr expr;
    PrintStatement(ExprPtr e);
    void accept(Visitor& v) const override;
    ~PrintStatement() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

class SkipStatement : public Instruction {
public:
    void accept(Visitor& v) const override;
};

class Guard : public ASTNode {
public:
    ExprPtr condition;
    InstructionList body;
    Guard(ExprPtr c, InstructionList b);
    ~Guard() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

using GuardList = std::vector<std::unique_ptr<Guard>>;

class IfStatement : public Instruction {
public:
    GuardList guards;
    IfStatement(GuardList g);
    void accept(Visitor& v) const override;
    ~IfStatement() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

class WhileLoop : public Instruction {
public:
    GuardList guards;
    WhileLoop(GuardList g);
    void accept(Visitor& v) const override;
    ~WhileLoop() override;

protected:
    void releaseChildren(NodeStack& out) override;
};

} // namespace gcl
