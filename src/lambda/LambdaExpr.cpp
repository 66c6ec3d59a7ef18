#include "LambdaExpr.hpp"

namespace gcl::lambda {

TermPtr var(std::string name) {
    return std::make_shared<const Term>(Term{Variable{std::move(name)}});
}

TermPtr lam(std::string param, TermPtr body) {
    return std::make_shared<const Term>(Term{Abstraction{std::move(param), std::move(body)}});
}

TermPtr lam(const std::vector<std::string>& params, TermPtr body) {
    for (auto it = params.rbegin(); it != params.rend(); ++it) {
        body = lam(*it, std::move(body));
    }
    return body;
}

TermPtr app(TermPtr function, TermPtr argument) {
    return std::make_shared<const Term>(Term{Application{std::move(function), std::move(argument)}});
}

TermPtr app(TermPtr function, std::initializer_list<TermPtr> arguments) {
    for (const auto& arg : arguments) {
        function = app(std::move(function), arg);
    }
    return function;
}

TermPtr comb(std::string name) {
    return std::make_shared<const Term>(Term{Combinator{std::move(name)}});
}

TermPtr num(unsigned value) {
    return std::make_shared<const Term>(Term{Numeral{value}});
}

bool equals(const TermPtr& a, const TermPtr& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    if (a->node.index() != b->node.index()) return false;

    if (auto* v = a->as<Variable>()) return v->name == b->as<Variable>()->name;
    if (auto* c = a->as<Combinator>()) return c->name == b->as<Combinator>()->name;
    if (auto* n = a->as<Numeral>()) return n->value == b->as<Numeral>()->value;
    if (auto* l = a->as<Abstraction>()) {
        auto* r = b->as<Abstraction>();
        return l->param == r->param && equals(l->body, r->body);
    }
    auto* l = a->as<Application>();
    auto* r = b->as<Application>();
    return equals(l->function, r->function) && equals(l->argument, r->argument);
}

namespace {

void collectCombinators(const TermPtr& t, std::set<std::string>& out) {
    if (auto* c = t->as<Combinator>()) {
        out.insert(c->name);
    } else if (auto* l = t->as<Abstraction>()) {
        collectCombinators(l->body, out);
    } else if (auto* a = t->as<Application>()) {
        collectCombinators(a->function, out);
        collectCombinators(a->argument, out);
    }
}

void collectFree(const TermPtr& t, std::multiset<std::string>& bound, std::set<std::string>& out) {
    if (auto* v = t->as<Variable>()) {
        if (!bound.count(v->name)) out.insert(v->name);
    } else if (auto* l = t->as<Abstraction>()) {
        auto it = bound.insert(l->param);
        collectFree(l->body, bound, out);
        bound.erase(it);
    } else if (auto* a = t->as<Application>()) {
        collectFree(a->function, bound, out);
        collectFree(a->argument, bound, out);
    }
}

} // namespace

std::set<std::string> combinatorsOf(const TermPtr& term) {
    std::set<std::string> out;
    if (term) collectCombinators(term, out);
    return out;
}

std::set<std::string> freeVariables(const TermPtr& term) {
    std::set<std::string> out;
    std::multiset<std::string> bound;
    if (term) collectFree(term, bound, out);
    return out;
}

} // namespace gcl::lambda
