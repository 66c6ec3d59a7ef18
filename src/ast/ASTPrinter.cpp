#include "ASTPrinter.hpp"
#include <iterator>

namespace gcl {

namespace {

std::string typeSuffix(const TypePtr& type) {
    return type ? " : " + type->toString() : "";
}

} // namespace

std::string ASTPrinter::print(const Block& root) {
    out.clear();
    prefix.clear();
    indent.clear();
    root.accept(*this);
    return fmt::to_string(out);
}

void ASTPrinter::line(const std::string& text) {
    fmt::format_to(std::back_inserter(out), "{}{}\n", prefix, text);
}

template <typename F>
void ASTPrinter::nested(bool isLast, F&& body) {
    std::string savedPrefix = prefix;
    std::string savedIndent = indent;

    prefix = indent + (isLast ? "└── " : "├── ");
    indent = indent + (isLast ? "    " : "│   ");
    body();

    prefix = savedPrefix;
    indent = savedIndent;
}

void ASTPrinter::child(const Expression& node, bool isLast) {
    nested(isLast, [&]() { node.accept(*this); });
}

void ASTPrinter::child(const Instruction& node, bool isLast) {
    nested(isLast, [&]() { node.accept(*this); });
}

void ASTPrinter::label(const std::string& text, bool isLast) {
    nested(isLast, [&]() { line(text); });
}

// --- Instructions ---

void ASTPrinter::visit(const Block& node) {
    line("Block");
    for (auto& decl : node.declarations) {
        std::string names;
        for (size_t i = 0; i < decl->names.size(); ++i) {
            if (i) names += ", ";
            names += decl->names[i].name;
        }
        label(fmt::format("Declare {} {}", decl->type->toString(), names), false);
    }
    for (const Symbol& sym : node.symbols) {
        label(fmt::format("Symbol {} : {} @slot {}", sym.name, sym.type->toString(), sym.slot), false);
    }
    for (size_t i = 0; i < node.instructions.size(); ++i) {
        child(*node.instructions[i], i + 1 == node.instructions.size());
    }
}

void ASTPrinter::visit(const Assignment& node) {
    if (node.slot >= 0) line(fmt::format("Assign {} @slot {}", node.target, node.slot));
    else line(fmt::format("Assign {}", node.target));
    child(*node.value, true);
}

void ASTPrinter::visit(const PrintStatement& node) {
    line("Print");
    child(*node.expr, true);
}

void ASTPrinter::visit(const SkipStatement&) {
    line("Skip");
}

void ASTPrinter::guards(const GuardList& list) {
    for (size_t i = 0; i < list.size(); ++i) {
        const Guard& g = *list[i];
        nested(i + 1 == list.size(), [&]() {
            line("Guard");
            child(*g.condition, g.body.empty());
            for (size_t j = 0; j < g.body.size(); ++j) {
                child(*g.body[j], j + 1 == g.body.size());
            }
        });
    }
}

void ASTPrinter::visit(const IfStatement& node) {
    line("If");
    guards(node.guards);
}

void ASTPrinter::visit(const WhileLoop& node) {
    line("While");
    guards(node.guards);
}

// --- Expressions ---

void ASTPrinter::visit(const Literal& node) {
    if (node.kind == ASTTokenKind::STRING_LITERAL) {
        line(fmt::format("Literal \"{}\"{}", node.value, typeSuffix(node.type)));
    } else {
        line(fmt::format("Literal {}{}", node.value, typeSuffix(node.type)));
    }
}

void ASTPrinter::visit(const Identifier& node) {
    if (node.slot >= 0) line(fmt::format("Identifier {}{} @slot {}", node.name, typeSuffix(node.type), node.slot));
    else line(fmt::format("Identifier {}{}", node.name, typeSuffix(node.type)));
}

void ASTPrinter::visit(const BinaryOp& node) {
    line(fmt::format("BinaryOp '{}'{}", astTokenKindToString(node.op), typeSuffix(node.type)));
    child(*node.left, false);
    child(*node.right, true);
}

void ASTPrinter::visit(const UnaryOp& node) {
    line(fmt::format("UnaryOp '{}'{}", astTokenKindToString(node.op), typeSuffix(node.type)));
    child(*node.operand, true);
}

void ASTPrinter::visit(const ApplyExpression& node) {
    line(fmt::format("Apply{}", typeSuffix(node.type)));
    child(*node.function, false);
    child(*node.index, true);
}

void ASTPrinter::visit(const FunctionUpdate& node) {
    line(fmt::format("Update{}", typeSuffix(node.type)));
    child(*node.function, false);
    child(*node.index, false);
    child(*node.value, true);
}

} // namespace gcl
