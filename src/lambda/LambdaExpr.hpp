#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <set>

namespace gcl::lambda {

struct Term;
using TermPtr = std::shared_ptr<const Term>;

struct Variable {
    std::string name;
};

struct Abstraction {
    std::string param;
    TermPtr body;
};

struct Application {
    TermPtr function;
    TermPtr argument;
};

// Reference to a named prelude definition.
struct Combinator {
    std::string name;
};

// Church numeral: λf.λx.f (f ... x)
struct Numeral {
    unsigned value;
};

struct Term {
    std::variant<Variable, Abstraction, Application, Combinator, Numeral> node;

    template <typename T>
    const T* as() const { return std::get_if<T>(&node); }
};

// --- Builders ---
TermPtr var(std::string name);
TermPtr lam(std::string param, TermPtr body);
TermPtr lam(const std::vector<std::string>& params, TermPtr body);
TermPtr app(TermPtr function, TermPtr argument);
// Left-nested application: ((f a1) a2) ...
TermPtr app(TermPtr function, std::initializer_list<TermPtr> arguments);
TermPtr comb(std::string name);
TermPtr num(unsigned value);

// Structural equality; bound names must match exactly.
bool equals(const TermPtr& a, const TermPtr& b);

// Names of the combinators referenced directly by `term`.
std::set<std::string> combinatorsOf(const TermPtr& term);

// Free variables of `term`.
std::set<std::string> freeVariables(const TermPtr& term);

} // namespace gcl::lambda
