#include "SourcePrinter.hpp"
#include <fmt/core.h>

namespace gcl {

std::string SourcePrinter::print(const Block& root) {
    out.clear();
    indent = 0;
    root.accept(*this);
    out += "\n";
    return out;
}

void SourcePrinter::newline() {
    out += "\n";
    out.append(indent * 2, ' ');
}

void SourcePrinter::instructions(const InstructionList& list) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (i) {
            out += ";";
            newline();
        }
        list[i]->accept(*this);
    }
}

void SourcePrinter::visit(const Block& node) {
    out += "{";
    indent++;
    for (auto& decl : node.declarations) {
        newline();
        out += decl->type->toString() + " ";
        for (size_t i = 0; i < decl->names.size(); ++i) {
            if (i) out += ", ";
            out += decl->names[i].name;
        }
        out += ";";
    }
    newline();
    instructions(node.instructions);
    indent--;
    newline();
    out += "}";
}

void SourcePrinter::visit(const Assignment& node) {
    out += node.target + " := ";
    node.value->accept(*this);
}

void SourcePrinter::visit(const PrintStatement& node) {
    out += "print ";
    node.expr->accept(*this);
}

void SourcePrinter::visit(const SkipStatement&) {
    out += "skip";
}

void SourcePrinter::guards(const GuardList& list) {
    indent++;
    for (size_t i = 0; i < list.size(); ++i) {
        newline();
        if (i) out += "[] ";
        list[i]->condition->accept(*this);
        out += " -->";
        indent++;
        newline();
        instructions(list[i]->body);
        indent--;
    }
    indent--;
    newline();
}

void SourcePrinter::visit(const IfStatement& node) {
    out += "if";
    guards(node.guards);
    out += "fi";
}

void SourcePrinter::visit(const WhileLoop& node) {
    out += "while";
    guards(node.guards);
    out += "end";
}

void SourcePrinter::visit(const Literal& node) {
    if (node.kind != ASTTokenKind::STRING_LITERAL) {
        out += node.value;
        return;
    }
    out += '"';
    for (char c : node.value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    out += '"';
}

void SourcePrinter::visit(const Identifier& node) {
    out += node.name;
}

void SourcePrinter::visit(const BinaryOp& node) {
    out += "(";
    node.left->accept(*this);
    out += node.op == ASTTokenKind::COMMA ? ", " : fmt::format(" {} ", astTokenKindToString(node.op));
    node.right->accept(*this);
    out += ")";
}

void SourcePrinter::visit(const UnaryOp& node) {
    out += "(";
    out += astTokenKindToString(node.op);
    node.operand->accept(*this);
    out += ")";
}

void SourcePrinter::visit(const ApplyExpression& node) {
    out += "(";
    node.function->accept(*this);
    out += " . ";
    node.index->accept(*this);
    out += ")";
}

void SourcePrinter::visit(const FunctionUpdate& node) {
    out += "(";
    node.function->accept(*this);
    out += "(";
    node.index->accept(*this);
    out += " : ";
    node.value->accept(*this);
    out += "))";
}

} // namespace gcl
