#include "LambdaPrinter.hpp"
#include "Prelude.hpp"
#include <iterator>

namespace gcl::lambda {

std::string LambdaPrinter::print(const TermPtr& term) const {
    fmt::memory_buffer out;
    write(out, term);
    return fmt::to_string(out);
}

std::string LambdaPrinter::printProgram(const TermPtr& program) const {
    fmt::memory_buffer out;
    if (options.emitPrelude && !options.inlineCombinators) {
        for (const Definition* def : Prelude::instance().closure(program)) {
            fmt::format_to(std::back_inserter(out), "{} = ", def->name);
            write(out, def->body);
            fmt::format_to(std::back_inserter(out), "\n");
        }
    }
    fmt::format_to(std::back_inserter(out), "main = ");
    write(out, program);
    fmt::format_to(std::back_inserter(out), "\n");
    return fmt::to_string(out);
}

void LambdaPrinter::writeNumeral(fmt::memory_buffer& out, unsigned value) const {
    fmt::format_to(std::back_inserter(out), "{}f.{}x.", lambda(), lambda());
    for (unsigned i = 0; i < value; ++i) fmt::format_to(std::back_inserter(out), "(f ");
    fmt::format_to(std::back_inserter(out), "x");
    for (unsigned i = 0; i < value; ++i) fmt::format_to(std::back_inserter(out), ")");
}

// Abstractions extend as far right as possible, so they need parentheses
// when something follows them.
void LambdaPrinter::writeOperator(fmt::memory_buffer& out, const TermPtr& term) const {
    bool wrap = term->as<Abstraction>() || term->as<Numeral>();
    if (auto* c = term->as<Combinator>()) {
        if (options.inlineCombinators) {
            const Definition* def = Prelude::instance().find(c->name);
            wrap = def && !def->body->as<Application>() && !def->body->as<Variable>();
        }
    }
    if (wrap) fmt::format_to(std::back_inserter(out), "(");
    write(out, term);
    if (wrap) fmt::format_to(std::back_inserter(out), ")");
}

void LambdaPrinter::write(fmt::memory_buffer& out, const TermPtr& term) const {
    if (auto* v = term->as<Variable>()) {
        fmt::format_to(std::back_inserter(out), "{}", v->name);
    } else if (auto* c = term->as<Combinator>()) {
        const Definition* def = options.inlineCombinators ? Prelude::instance().find(c->name) : nullptr;
        if (def) write(out, def->body);
        else fmt::format_to(std::back_inserter(out), "{}", c->name);
    } else if (auto* n = term->as<Numeral>()) {
        writeNumeral(out, n->value);
    } else if (auto* l = term->as<Abstraction>()) {
        fmt::format_to(std::back_inserter(out), "{}{}.", lambda(), l->param);
        write(out, l->body);
    } else if (auto* a = term->as<Application>()) {
        fmt::format_to(std::back_inserter(out), "(");
        writeOperator(out, a->function);
        fmt::format_to(std::back_inserter(out), " ");
        write(out, a->argument);
        fmt::format_to(std::back_inserter(out), ")");
    }
}

} // namespace gcl::lambda
