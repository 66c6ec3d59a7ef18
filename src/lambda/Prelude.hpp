#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "LambdaExpr.hpp"

namespace gcl::lambda {

struct Definition {
    std::string name;
    TermPtr body;
};

// Named combinators the translator emits. Each definition only refers to
// definitions listed before it, so the table is in dependency order.
class Prelude {
public:
    static const Prelude& instance();

    const Definition* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    const std::vector<Definition>& definitions() const { return defs; }

    // Every definition `term` needs, transitively, in dependency order.
    std::vector<const Definition*> closure(const TermPtr& term) const;

    // Definitions that failed to read or refer forward; empty when healthy.
    const std::vector<std::string>& problems() const { return errors; }

private:
    Prelude();

    std::vector<Definition> defs;
    std::unordered_map<std::string, size_t> index;
    std::vector<std::string> errors;
};

} // namespace gcl::lambda
