#pragma once
#include <string>
#include <fmt/format.h>
#include "LambdaExpr.hpp"

namespace gcl::lambda {

struct PrintOptions {
    bool ascii = false;             // '\' instead of 'λ'
    bool inlineCombinators = false; // expand every combinator reference
    bool emitPrelude = true;        // prefix used definitions as NAME = term
};

class LambdaPrinter {
public:
    explicit LambdaPrinter(PrintOptions opts = {}) : options(opts) {}

    std::string print(const TermPtr& term) const;

    // Used prelude definitions (unless disabled or inlined), then `main = term`.
    std::string printProgram(const TermPtr& program) const;

private:
    PrintOptions options;

    void write(fmt::memory_buffer& out, const TermPtr& term) const;
    void writeOperator(fmt::memory_buffer& out, const TermPtr& term) const;
    void writeNumeral(fmt::memory_buffer& out, unsigned value) const;
    const char* lambda() const { return options.ascii ? "\\" : "\xCE\xBB"; }
};

} // namespace gcl::lambda
