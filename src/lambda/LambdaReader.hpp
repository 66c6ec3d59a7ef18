#pragma once
#include <string>
#include "LambdaExpr.hpp"

namespace gcl::lambda {

// Reads the textual term syntax written by LambdaPrinter:
//   term  := ('λ' | '\') name+ '.' term | atom+
//   atom  := name | digits | '(' term ')'
// Names starting with an upper-case letter are combinators, digits are
// Church numerals. Returns null and fills `error` on malformed input.
TermPtr readTerm(const std::string& text, std::string* error = nullptr);

} // namespace gcl::lambda
