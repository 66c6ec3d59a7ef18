#include "../Translator.hpp"
#include "../../types/TypeImpl.hpp"
#include <fmt/core.h>
#include <fmt/color.h>

namespace gcl {

using namespace lambda;

namespace {

// Output tags understood by whoever decodes the output list.
unsigned printTag(const TypePtr& type) {
    if (isInt(type)) return 0;
    if (isBool(type)) return 1;
    if (isString(type)) return 2;
    return 3;
}

} // namespace

void Translator::visit(const Block& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    if (options.debug) {
        fmt::print(fg(fmt::color::gray), "[DEBUG] Block at {}:{} declares {} slot(s)\n",
                   node.line, node.column, node.symbols.size());
    }

    std::vector<TermPtr> steps;
    for (const Symbol& sym : node.symbols) {
        TermPtr init = defaultValue(sym.type, node);
        if (!init) return;
        steps.push_back(app(comb("DECLARE"), {num(static_cast<unsigned>(sym.slot)), init}));
    }
    for (auto& instr : node.instructions) {
        TermPtr t = instruction(*instr);
        if (!t) return;
        steps.push_back(t);
    }
    lastTerm = sequence(std::move(steps));
}

void Translator::visit(const Assignment& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    if (node.slot < 0 || !node.targetType) {
        fail(node, DiagnosticKind::UnsupportedConstruct,
             fmt::format("Assignment to '{}' was not resolved", node.target));
        return;
    }

    TermPtr value = expression(*node.value);
    if (!value) return;

    // A single int stored into a function[..0]
    if (isInt(node.value->type) && isFunction(node.targetType)) {
        value = app(comb("CONS"), {value, comb("NIL")});
    }

    lastTerm = app(comb("ASSIGN"), {num(static_cast<unsigned>(node.slot)), lam("s", value)});
}

void Translator::visit(const PrintStatement& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    TermPtr fn = stateFunction(*node.expr);
    if (!fn) return;
    lastTerm = app(comb("PRINT"), {num(printTag(node.expr->type)), fn});
}

void Translator::visit(const SkipStatement& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;
    lastTerm = comb("SKIP");
}

TermPtr Translator::guardChain(const GuardList& guards, TermPtr fallback, const TermPtr& loop) {
    // Built from the last guard outwards: the first guard is tested first.
    TermPtr chain = std::move(fallback);
    for (auto it = guards.rbegin(); it != guards.rend(); ++it) {
        const Guard& g = **it;
        TermPtr cond = stateFunction(*g.condition);
        if (!cond) return nullptr;
        TermPtr body = sequence(g.body);
        if (!body) return nullptr;
        if (loop) body = app(comb("SEQ"), {body, loop});
        chain = app(comb("IFGUARD"), {cond, body, chain});
    }
    return chain;
}

void Translator::visit(const IfStatement& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    // No guard holds: the configuration is marked aborted
    TermPtr chain = guardChain(node.guards, comb("ABORT"), nullptr);
    if (!chain) return;
    lastTerm = chain;
}

void Translator::visit(const WhileLoop& node) {
    DepthGuard guard(*this, node);
    if (!guard) return;

    std::string name = fmt::format("loop{}", loopCounter++);
    TermPtr chain = guardChain(node.guards, comb("SKIP"), var(name));
    if (!chain) return;
    lastTerm = app(comb("Z"), lam(name, chain));
}

} // namespace gcl
