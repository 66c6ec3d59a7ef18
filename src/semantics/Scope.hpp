#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "Symbol.hpp"

namespace gcl {

class Scope {
public:
    Scope* parent;
    std::unordered_map<std::string, Symbol> symbols;
    std::vector<std::string> order; // declaration order

    Scope(Scope* p = nullptr) : parent(p) {}

    // False when the name is already declared in this scope.
    bool define(Symbol sym) {
        if (symbols.count(sym.name)) return false;
        order.push_back(sym.name);
        symbols[sym.name] = std::move(sym);
        return true;
    }

    const Symbol* resolveLocal(const std::string& name) const {
        auto it = symbols.find(name);
        return it == symbols.end() ? nullptr : &it->second;
    }

    const Symbol* resolve(const std::string& name) const {
        if (auto* sym = resolveLocal(name)) return sym;
        if (parent) return parent->resolve(name);
        return nullptr;
    }

    // Every name reachable from this scope, innermost first.
    std::vector<std::string> visibleNames() const {
        std::vector<std::string> names;
        for (const Scope* s = this; s; s = s->parent) {
            names.insert(names.end(), s->order.begin(), s->order.end());
        }
        return names;
    }
};

} // namespace gcl
