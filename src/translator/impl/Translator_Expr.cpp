#include "../Translator.hpp"
#include "../../types/TypeImpl.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <string>

namespace gcl {

using namespace lambda;

namespace {

const char* arithmeticCombinator(ASTTokenKind op) {
    switch (op) {
        case ASTTokenKind::PLUS: return "ADD";
        case ASTTokenKind::MINUS: return "SUB";
        case ASTTokenKind::MULT: return "MUL";
        case ASTTokenKind::AND: return "AND";
        case ASTTokenKind::OR: return "OR";
        case ASTTokenKind::LT: return "LT";
        case ASTTokenKind::LTEQ: return "LEQ";
        case ASTTokenKind::GT: return "GT";
        case ASTTokenKind::GTEQ: return "GEQ";
        default: return nullptr;
    }
}

void flattenComma(const Expression& expr, std::vector<const Expression*>& out) {
    auto* bin = dynamic_cast<const BinaryOp*>(&expr);
    if (bin && bin->op == ASTTokenKind::COMMA) {
        flattenComma(*bin->left, out);
        flattenComma(*bin->right, out);
    } else {
        out.push_back(&expr);
    }
}

} // namespace

void Translator::visit(const Literal& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    switch (node.kind) {
        case ASTTokenKind::INTEGER: {
            // Leading zeros do not count towards the length; "000" stays "0"
            std::string digits = node.value;
            digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));
            if (digits.size() > 18) {
                fail(node, DiagnosticKind::UnsupportedConstruct,
                     fmt::format("Integer literal {} is too large", node.value));
                return;
            }
            lastTerm = integer(std::stoull(digits), node);
            return;
        }
        case ASTTokenKind::BOOL:
            lastTerm = comb(node.value == "true" ? "TRUE" : "FALSE");
            return;
        case ASTTokenKind::STRING_LITERAL: {
            // List of byte values
            TermPtr list = comb("NIL");
            for (auto it = node.value.rbegin(); it != node.value.rend(); ++it) {
                list = app(comb("CONS"), {num(static_cast<unsigned char>(*it)), list});
            }
            lastTerm = list;
            return;
        }
        default:
            fail(node, DiagnosticKind::UnsupportedConstruct, "Unknown literal kind");
    }
}

void Translator::visit(const Identifier& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    if (node.slot < 0) {
        fail(node, DiagnosticKind::UnsupportedConstruct,
             fmt::format("Identifier '{}' was not resolved", node.name));
        return;
    }
    lastTerm = app(comb("NTH"), {var("s"), num(static_cast<unsigned>(node.slot))});
}

TermPtr Translator::showAsString(const Expression& node) {
    TermPtr value = expression(node);
    if (!value) return nullptr;
    if (isInt(node.type)) return app(comb("SHOWINT"), value);
    if (isBool(node.type)) return app(comb("SHOWBOOL"), value);
    return value;
}

TermPtr Translator::equality(const Expression& left) {
    if (isBool(left.type)) return comb("BEQ");
    if (isString(left.type)) return comb("STREQ");
    if (isFunction(left.type)) return comb("FUNEQ");
    return comb("EQ");
}

void Translator::visit(const BinaryOp& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    if (node.op == ASTTokenKind::COMMA) {
        std::vector<const Expression*> items;
        flattenComma(node, items);
        std::vector<TermPtr> values;
        for (const Expression* item : items) {
            TermPtr v = expression(*item);
            if (!v) return;
            values.push_back(v);
        }
        TermPtr list = comb("NIL");
        for (auto it = values.rbegin(); it != values.rend(); ++it) {
            list = app(comb("CONS"), {*it, list});
        }
        lastTerm = list;
        return;
    }

    if (node.op == ASTTokenKind::PLUS && isString(node.type)) {
        TermPtr left = showAsString(*node.left);
        if (!left) return;
        TermPtr right = showAsString(*node.right);
        if (!right) return;
        lastTerm = app(comb("CONCAT"), {left, right});
        return;
    }

    TermPtr left = expression(*node.left);
    if (!left) return;
    TermPtr right = expression(*node.right);
    if (!right) return;

    switch (node.op) {
        case ASTTokenKind::EQEQ:
            lastTerm = app(equality(*node.left), {left, right});
            return;
        case ASTTokenKind::NOTEQ:
            lastTerm = app(comb("NOT"), app(equality(*node.left), {left, right}));
            return;
        default:
            break;
    }

    const char* name = arithmeticCombinator(node.op);
    if (!name) {
        fail(node, DiagnosticKind::UnsupportedConstruct,
             fmt::format("Operator '{}' has no encoding", astTokenKindToString(node.op)));
        return;
    }
    lastTerm = app(comb(name), {left, right});
}

void Translator::visit(const UnaryOp& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    TermPtr operand = expression(*node.operand);
    if (!operand) return;
    lastTerm = app(comb(node.op == ASTTokenKind::NOT ? "NOT" : "NEG"), operand);
}

void Translator::visit(const ApplyExpression& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    TermPtr fn = expression(*node.function);
    if (!fn) return;
    TermPtr index = expression(*node.index);
    if (!index) return;
    lastTerm = app(comb("INDEX"), {fn, index});
}

void Translator::visit(const FunctionUpdate& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    TermPtr fn = expression(*node.function);
    if (!fn) return;
    TermPtr index = expression(*node.index);
    if (!index) return;
    TermPtr value = expression(*node.value);
    if (!value) return;
    lastTerm = app(comb("UPDATE"), {fn, index, value});
}

} // namespace gcl
