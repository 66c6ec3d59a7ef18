#include "support/LambdaEvaluator.hpp"
#include "lambda/Prelude.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>

namespace gcl::test_support {

using namespace gcl::lambda;

struct Node {
    enum Kind { Var, Free, Lam, App, Global } kind;
    int index = 0;           // Var: de Bruijn index
    std::string name;        // Free, Global
    const Node* body = nullptr;
    const Node* fn = nullptr;
    const Node* arg = nullptr;
};

struct Value {
    bool closure = false;
    const Node* body = nullptr;      // closure
    EnvPtr env;
    std::string head;                // neutral
    std::vector<ThunkPtr> args;
};

struct Thunk {
    const Node* node = nullptr;
    EnvPtr env;
    ValuePtr value;
    bool busy = false;
};

struct Env {
    ThunkPtr thunk;
    EnvPtr next;
};

LambdaEvaluator::LambdaEvaluator() = default;
LambdaEvaluator::~LambdaEvaluator() = default;

Node* LambdaEvaluator::make(Node node) {
    arena.push_back(std::make_unique<Node>(std::move(node)));
    return arena.back().get();
}

const Node* LambdaEvaluator::numeral(unsigned value) {
    // λf.λx.f (f ... x): under two binders f is index 1, x is index 0
    Node x;
    x.kind = Node::Var;
    x.index = 0;
    const Node* body = make(x);
    for (unsigned i = 0; i < value; ++i) {
        Node f;
        f.kind = Node::Var;
        f.index = 1;
        Node a;
        a.kind = Node::App;
        a.fn = make(f);
        a.arg = body;
        body = make(a);
    }
    Node inner;
    inner.kind = Node::Lam;
    inner.body = body;
    Node outer;
    outer.kind = Node::Lam;
    outer.body = make(inner);
    return make(outer);
}

const Node* LambdaEvaluator::compile(const TermPtr& term, std::vector<std::string>& bound) {
    Node n;
    if (auto* v = term->as<Variable>()) {
        auto it = std::find(bound.rbegin(), bound.rend(), v->name);
        if (it == bound.rend()) {
            n.kind = Node::Free;
            n.name = v->name;
        } else {
            n.kind = Node::Var;
            n.index = static_cast<int>(it - bound.rbegin());
        }
    } else if (auto* c = term->as<Combinator>()) {
        n.kind = Node::Global;
        n.name = c->name;
    } else if (auto* num = term->as<Numeral>()) {
        return numeral(num->value);
    } else if (auto* l = term->as<Abstraction>()) {
        bound.push_back(l->param);
        n.kind = Node::Lam;
        n.body = compile(l->body, bound);
        bound.pop_back();
    } else if (auto* a = term->as<Application>()) {
        n.kind = Node::App;
        n.fn = compile(a->function, bound);
        n.arg = compile(a->argument, bound);
    }
    return make(n);
}

ThunkPtr LambdaEvaluator::global(const std::string& name) {
    auto it = globals.find(name);
    if (it != globals.end()) return it->second;

    const Definition* def = Prelude::instance().find(name);
    if (!def) throw std::runtime_error(fmt::format("unknown combinator {}", name));
    std::vector<std::string> bound;
    auto thunk = std::make_shared<Thunk>();
    thunk->node = compile(def->body, bound);
    globals[name] = thunk;
    return thunk;
}

ThunkPtr LambdaEvaluator::ready(const ValuePtr& v) {
    auto thunk = std::make_shared<Thunk>();
    thunk->value = v;
    return thunk;
}

ThunkPtr LambdaEvaluator::marker(const std::string& name) {
    auto v = std::make_shared<Value>();
    v->head = name;
    return ready(v);
}

ValuePtr LambdaEvaluator::force(const ThunkPtr& thunk) {
    if (thunk->value) return thunk->value;
    if (thunk->busy) throw std::runtime_error("infinite loop: thunk forced while being evaluated");
    thunk->busy = true;
    ValuePtr v = eval(thunk->node, thunk->env);
    thunk->busy = false;
    thunk->value = v;
    thunk->env.reset();
    return v;
}

ValuePtr LambdaEvaluator::eval(const Node* node, EnvPtr env) {
    for (;;) {
        if (++stepCount > stepLimit) throw std::runtime_error("step limit exceeded");

        switch (node->kind) {
            case Node::Var: {
                Env* e = env.get();
                for (int i = 0; i < node->index; ++i) e = e->next.get();
                return force(e->thunk);
            }
            case Node::Free: {
                auto v = std::make_shared<Value>();
                v->head = node->name;
                return v;
            }
            case Node::Lam: {
                auto v = std::make_shared<Value>();
                v->closure = true;
                v->body = node->body;
                v->env = env;
                return v;
            }
            case Node::Global:
                return force(global(node->name));
            case Node::App: {
                ValuePtr fn = eval(node->fn, env);
                auto arg = std::make_shared<Thunk>();
                arg->node = node->arg;
                arg->env = env;
                if (!fn->closure) {
                    auto v = std::make_shared<Value>(*fn);
                    v->args.push_back(arg);
                    return v;
                }
                env = std::make_shared<Env>(Env{arg, fn->env});
                node = fn->body;
                continue;
            }
        }
    }
}

ValuePtr LambdaEvaluator::apply(const ValuePtr& fn, const ThunkPtr& arg) {
    if (!fn->closure) {
        auto v = std::make_shared<Value>(*fn);
        v->args.push_back(arg);
        return v;
    }
    return eval(fn->body, std::make_shared<Env>(Env{arg, fn->env}));
}

ValuePtr LambdaEvaluator::apply(const std::string& name, const ValuePtr& arg) {
    return apply(force(global(name)), ready(arg));
}

ValuePtr LambdaEvaluator::evaluate(const TermPtr& term) {
    std::vector<std::string> bound;
    return eval(compile(term, bound), nullptr);
}

bool LambdaEvaluator::toBool(const ValuePtr& v) {
    ValuePtr r = apply(apply(v, marker("#true")), marker("#false"));
    if (!r->closure && r->args.empty()) {
        if (r->head == "#true") return true;
        if (r->head == "#false") return false;
    }
    throw std::runtime_error("value is not a Church boolean");
}

long long LambdaEvaluator::toNat(const ValuePtr& v) {
    ValuePtr r = apply(apply(v, marker("#succ")), marker("#zero"));
    long long n = 0;
    while (!r->closure && r->head == "#succ" && r->args.size() == 1) {
        n++;
        r = force(r->args[0]);
    }
    if (r->closure || r->head != "#zero" || !r->args.empty()) {
        throw std::runtime_error("value is not a Church numeral");
    }
    return n;
}

ValuePtr LambdaEvaluator::first(const ValuePtr& pair) {
    return apply(pair, global("TRUE"));
}

ValuePtr LambdaEvaluator::second(const ValuePtr& pair) {
    return apply(pair, global("FALSE"));
}

long long LambdaEvaluator::toInt(const ValuePtr& v) {
    return toNat(first(v)) - toNat(second(v));
}

std::vector<ValuePtr> LambdaEvaluator::toList(const ValuePtr& v) {
    std::vector<ValuePtr> items;
    ValuePtr cur = v;
    while (!toBool(apply("ISNIL", cur))) {
        items.push_back(first(cur));
        cur = second(cur);
    }
    return items;
}

std::string LambdaEvaluator::toText(const ValuePtr& v) {
    std::string text;
    for (const auto& c : toList(v)) text += static_cast<char>(toNat(c));
    return text;
}

std::string LambdaEvaluator::render(long long tag, const ValuePtr& v) {
    switch (tag) {
        case 0: return std::to_string(toInt(v));
        case 1: return toBool(v) ? "true" : "false";
        case 2: return toText(v);
        default: {
            std::string s = "[";
            auto items = toList(v);
            for (size_t i = 0; i < items.size(); ++i) {
                if (i) s += ", ";
                s += std::to_string(toInt(items[i]));
            }
            return s + "]";
        }
    }
}

LambdaEvaluator::Outcome LambdaEvaluator::run(const TermPtr& program) {
    Outcome outcome;
    outcome.configuration = evaluate(program);
    outcome.ok = toBool(apply("OK", outcome.configuration));
    for (const auto& entry : toList(apply("OUT", outcome.configuration))) {
        outcome.output.push_back(render(toNat(first(entry)), second(entry)));
    }
    return outcome;
}

std::vector<ValuePtr> LambdaEvaluator::state(const ValuePtr& configuration) {
    return toList(apply("STATE", configuration));
}

} // namespace gcl::test_support
