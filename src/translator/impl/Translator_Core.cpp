#include "../Translator.hpp"
#include "../../diagnostics/DiagnosticEngine.hpp"
#include "../../lambda/Prelude.hpp"
#include "../../types/TypeImpl.hpp"
#include <fmt/core.h>
#include <fmt/color.h>

namespace gcl {

using namespace lambda;

Translator::Translator(DiagnosticEngine& d, TranslatorOptions opts)
    : diag(d), options(opts) {}

Translator::DepthGuard::DepthGuard(Translator& t, const ASTNode& node) : translator(t) {
    translator.depth++;
    ok = !translator.failed;
    if (ok && translator.depth > translator.options.maxDepth) {
        translator.fail(node, DiagnosticKind::DepthExceeded,
                        fmt::format("Program nesting exceeds the translation limit of {}",
                                    translator.options.maxDepth));
        ok = false;
    }
}

std::optional<Translation> Translator::translate(const Block& program, int slotCount) {
    failed = false;
    depth = 0;
    loopCounter = 0;

    TermPtr body = instruction(program);
    if (failed || !body) return std::nullopt;

    // Every slot starts out as integer zero; blocks overwrite theirs on entry.
    TermPtr state = comb("NIL");
    for (int i = 0; i < slotCount; ++i) {
        state = app(comb("CONS"), {comb("IZERO"), state});
    }

    Translation result;
    result.transformer = app(comb("RUN"), body);
    result.initialState = state;
    result.program = app(result.transformer, state);
    result.slotCount = slotCount;

    if (options.debug) {
        fmt::print(fg(fmt::color::gray), "[DEBUG] Translation uses {} prelude definition(s), {} slot(s)\n",
                   Prelude::instance().closure(result.program).size(), slotCount);
    }
    return result;
}

TermPtr Translator::instruction(const Instruction& node) {
    lastTerm = nullptr;
    node.accept(*this);
    if (failed) return nullptr;
    return lastTerm;
}

TermPtr Translator::expression(const Expression& node) {
    lastTerm = nullptr;
    if (!node.type) {
        fail(node, DiagnosticKind::UnsupportedConstruct, "Expression was not type checked");
        return nullptr;
    }
    node.accept(*this);
    if (failed) return nullptr;
    return lastTerm;
}

TermPtr Translator::stateFunction(const Expression& node) {
    TermPtr body = expression(node);
    if (!body) return nullptr;
    return lam("s", body);
}

TermPtr Translator::sequence(std::vector<TermPtr> steps) {
    if (steps.empty()) return comb("SKIP");
    TermPtr result = steps.back();
    for (size_t i = steps.size() - 1; i-- > 0;) {
        result = app(comb("SEQ"), {steps[i], result});
    }
    return result;
}

TermPtr Translator::sequence(const InstructionList& list) {
    std::vector<TermPtr> steps;
    for (auto& instr : list) {
        TermPtr t = instruction(*instr);
        if (!t) return nullptr;
        steps.push_back(t);
    }
    return sequence(std::move(steps));
}

TermPtr Translator::integer(unsigned long long value, const ASTNode& where) {
    if (value > options.maxNumeral) {
        fail(where, DiagnosticKind::UnsupportedConstruct,
             fmt::format("Integer literal {} exceeds the largest encodable numeral {}",
                         value, options.maxNumeral));
        return nullptr;
    }
    return app(comb("PAIR"), {num(static_cast<unsigned>(value)), num(0)});
}

TermPtr Translator::defaultValue(const TypePtr& type, const ASTNode& where) {
    if (isInt(type)) return comb("IZERO");
    if (isBool(type)) return comb("FALSE");
    if (auto* range = type ? type->as<FunctionRangeType>() : nullptr) {
        if (static_cast<unsigned>(range->length()) > options.maxNumeral) {
            fail(where, DiagnosticKind::UnsupportedConstruct,
                 fmt::format("Function range '{}' is too large to encode", range->toString()));
            return nullptr;
        }
        TermPtr list = comb("NIL");
        for (int i = 0; i < range->length(); ++i) {
            list = app(comb("CONS"), {comb("IZERO"), list});
        }
        return list;
    }
    fail(where, DiagnosticKind::UnsupportedConstruct,
         fmt::format("No default value for type '{}'", type ? type->toString() : "<unknown>"));
    return nullptr;
}

void Translator::fail(const ASTNode& node, DiagnosticKind kind, const std::string& msg) {
    if (failed) return;
    Diagnostic d;
    d.stage = DiagnosticStage::Translation;
    d.kind = kind;
    d.message = msg;
    d.line = node.line;
    d.column = node.column;
    diag.report(std::move(d));
    failed = true;
    lastTerm = nullptr;
}

} // namespace gcl
