#include "ASTNode.hpp"
#include "Visitor.hpp"

namespace gcl {

const char* astTokenKindToString(ASTTokenKind k) {
    switch (k) {
        case ASTTokenKind::INTEGER: return "int";
        case ASTTokenKind::BOOL: return "bool";
        case ASTTokenKind::STRING_LITERAL: return "string";
        case ASTTokenKind::PLUS: return "+";
        case ASTTokenKind::MINUS: return "-";
        case ASTTokenKind::MULT: return "*";
        case ASTTokenKind::AND: return "and";
        case ASTTokenKind::OR: return "or";
        case ASTTokenKind::NOT: return "!";
        case ASTTokenKind::EQEQ: return "==";
        case ASTTokenKind::NOTEQ: return "<>";
        case ASTTokenKind::LT: return "<";
        case ASTTokenKind::GT: return ">";
        case ASTTokenKind::LTEQ: return "<=";
        case ASTTokenKind::GTEQ: return ">=";
        case ASTTokenKind::COMMA: return ",";
    }
    return "?";
}

// --- Teardown ---
namespace {

template <typename T>
void release(std::vector<std::unique_ptr<ASTNode>>& out, std::unique_ptr<T>& child) {
    if (child) out.push_back(std::move(child));
}

template <typename T>
void release(std::vector<std::unique_ptr<ASTNode>>& out, std::vector<std::unique_ptr<T>>& children) {
    for (auto& child : children) release(out, child);
    children.clear();
}

} // namespace

void ASTNode::dismantle() {
    NodeStack pending;
    releaseChildren(pending);
    while (!pending.empty()) {
        std::unique_ptr<ASTNode> node = std::move(pending.back());
        pending.pop_back();
        node->releaseChildren(pending);
    }
}

// --- Types ---
TypeNode::TypeNode(TypeKind k, int n) : kind(k), upper(n) {}

std::string TypeNode::toString() const {
    switch (kind) {
        case TypeKind::INT: return "int";
        case TypeKind::BOOL: return "bool";
        case TypeKind::FUNCTION: return "function[.." + std::to_string(upper) + "]";
    }
    return "unknown";
}

Declaration::Declaration(std::unique_ptr<TypeNode> t, std::vector<DeclaredName> n)
    : type(std::move(t)), names(std::move(n)) {}

// --- Expressions ---
Literal::Literal(std::string v, ASTTokenKind k) : value(std::move(v)), kind(k) {}
void Literal::accept(Visitor& v) const { v.visit(*this); }

Identifier::Identifier(std::string n) : name(std::move(n)) {}
void Identifier::accept(Visitor& v) const { v.visit(*this); }

BinaryOp::BinaryOp(ExprPtr l, ASTTokenKind o, ExprPtr r)
    : left(std::move(l)), op(o), right(std::move(r)) {}
void BinaryOp::accept(Visitor& v) const { v.visit(*this); }
BinaryOp::~BinaryOp() { dismantle(); }
void BinaryOp::releaseChildren(NodeStack& out) {
    release(out, left);
    release(out, right);
}

UnaryOp::UnaryOp(ASTTokenKind o, ExprPtr e) : op(o), operand(std::move(e)) {}
void UnaryOp::accept(Visitor& v) const { v.visit(*this); }
UnaryOp::~UnaryOp() { dismantle(); }
void UnaryOp::releaseChildren(NodeStack& out) {
    release(out, operand);
}

ApplyExpression::ApplyExpression(ExprPtr f, ExprPtr i)
    : function(std::move(f)), index(std::move(i)) {}
void ApplyExpression::accept(Visitor& v) const { v.visit(*this); }
ApplyExpression::~ApplyExpression() { dismantle(); }
void ApplyExpression::releaseChildren(NodeStack& out) {
    release(out, function);
    release(out, index);
}

FunctionUpdate::FunctionUpdate(ExprPtr f, ExprPtr i, ExprPtr val)
    : function(std::move(f)), index(std::move(i)), value(std::move(val)) {}
void FunctionUpdate::accept(Visitor& v) const { v.visit(*this); }
FunctionUpdate::~FunctionUpdate() { dismantle(); }
void FunctionUpdate::releaseChildren(NodeStack& out) {
    release(out, function);
    release(out, index);
    release(out, value);
}

// --- Instructions ---
Block::Block(std::vector<std::unique_ptr<Declaration>> d, InstructionList i)
    : declarations(std::move(d)), instructions(std::move(i)) {}
void Block::accept(Visitor& v) const { v.visit(*this); }
Block::~Block() { dismantle(); }
void Block::releaseChildren(NodeStack& out) {
    release(out, declarations);
    release(out, instructions);
}

Assignment::Assignment(std::string t, ExprPtr val) : target(std::move(t)), value(std::move(val)) {}
void Assignment::accept(Visitor& v) const { v.visit(*this); }
Assignment::~Assignment() { dismantle(); }
void Assignment::releaseChildren(NodeStack& out) {
    release(out, value);
}

PrintStatement::PrintStatement(ExprPtr e) : expr(std::move(e)) {}
void PrintStatement::accept(Visitor& v) const { v.visit(*this); }
PrintStatement::~PrintStatement() { dismantle(); }
void PrintStatement::releaseChildren(NodeStack& out) {
    release(out, expr);
}

void SkipStatement::accept(Visitor& v) const { v.visit(*this); }

Guard::Guard(ExprPtr c, InstructionList b) : condition(std::move(c)), body(std::move(b)) {}
Guard::~Guard() { dismantle(); }
void Guard::releaseChildren(NodeStack& out) {
    release(out, condition);
    release(out, body);
}

IfStatement::IfStatement(GuardList g) : guards(std::move(g)) {}
void IfStatement::accept(Visitor& v) const { v.visit(*this); }
IfStatement::~IfStatement() { dismantle(); }
void IfStatement::releaseChildren(NodeStack& out) {
    release(out, guards);
}

WhileLoop::WhileLoop(GuardList g) : guards(std::move(g)) {}
void WhileLoop::accept(Visitor& v) const { v.visit(*this); }
WhileLoop::~WhileLoop() { dismantle(); }
void WhileLoop::releaseChildren(NodeStack& out) {
    release(out, guards);
}

} // namespace gcl
