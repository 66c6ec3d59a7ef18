#include "Prelude.hpp"
#include "LambdaReader.hpp"
#include <fmt/core.h>

namespace gcl::lambda {

namespace {

struct Source {
    const char* name;
    const char* text;
};

// Integers are pairs (p, n) standing for p - n. Lists are right-nested pairs
// ending in NIL. A configuration is TRIPLE ok state output.
const Source kPrelude[] = {
    // Booleans
    {"TRUE",    "\\t f.t"},
    {"FALSE",   "\\t f.f"},
    {"NOT",     "\\b.b FALSE TRUE"},
    {"AND",     "\\p q.p q FALSE"},
    {"OR",      "\\p q.p TRUE q"},
    {"BEQ",     "\\p q.p q (NOT q)"},

    // Pairs, triples, lists
    {"PAIR",    "\\a b f.f a b"},
    {"FST",     "\\p.p TRUE"},
    {"SND",     "\\p.p FALSE"},
    {"TRIPLE",  "\\o s u f.f o s u"},
    {"OK",      "\\c.c (\\o s u.o)"},
    {"STATE",   "\\c.c (\\o s u.s)"},
    {"OUT",     "\\c.c (\\o s u.u)"},
    {"NIL",     "\\f.TRUE"},
    {"CONS",    "PAIR"},
    {"HEAD",    "FST"},
    {"TAIL",    "SND"},
    {"ISNIL",   "\\l.l (\\h t.FALSE)"},

    // Fixed point for a call-by-need host
    {"Z",       "\\g.(\\x.g (\\v.x x v)) (\\x.g (\\v.x x v))"},

    // Naturals
    {"SUCC",    "\\n f x.f (n f x)"},
    {"PRED",    "\\n f x.n (\\g h.h (g f)) (\\u.x) (\\u.u)"},
    {"NADD",    "\\m n f x.m f (n f x)"},
    {"NSUB",    "\\m n.n PRED m"},
    {"NMUL",    "\\m n f.m (n f)"},
    {"ISZERO",  "\\n.n (\\x.FALSE) TRUE"},
    {"NLEQ",    "\\m n.ISZERO (NSUB m n)"},
    {"NLT",     "\\m n.NOT (NLEQ n m)"},
    {"NEQ",     "\\m n.AND (NLEQ m n) (NLEQ n m)"},
    {"NDIV",    "Z (\\r m n.NLT m n 0 (SUCC (r (NSUB m n) n)))"},
    {"NMOD",    "Z (\\r m n.NLT m n m (r (NSUB m n) n))"},

    // Integers
    {"IZERO",   "PAIR 0 0"},
    {"ADD",     "\\a b.PAIR (NADD (FST a) (FST b)) (NADD (SND a) (SND b))"},
    {"SUB",     "\\a b.PAIR (NADD (FST a) (SND b)) (NADD (SND a) (FST b))"},
    {"MUL",     "\\a b.PAIR (NADD (NMUL (FST a) (FST b)) (NMUL (SND a) (SND b))) "
                "(NADD (NMUL (FST a) (SND b)) (NMUL (SND a) (FST b)))"},
    {"NEG",     "\\a.PAIR (SND a) (FST a)"},
    {"LEQ",     "\\a b.NLEQ (NADD (FST a) (SND b)) (NADD (FST b) (SND a))"},
    {"LT",      "\\a b.NOT (LEQ b a)"},
    {"GT",      "\\a b.NOT (LEQ a b)"},
    {"GEQ",     "\\a b.LEQ b a"},
    {"EQ",      "\\a b.AND (LEQ a b) (LEQ b a)"},
    {"ISNEG",   "\\a.NOT (NLEQ (SND a) (FST a))"},
    {"TONAT",   "\\a.NSUB (FST a) (SND a)"},

    // Indexing
    {"NTH",     "\\l n.HEAD (n TAIL l)"},
    {"NTHOR",   "Z (\\r l n d.ISNIL l d (ISZERO n (HEAD l) (r (TAIL l) (PRED n) d)))"},
    {"INDEX",   "\\f i.ISNEG i IZERO (NTHOR f (TONAT i) IZERO)"},
    {"SETNTH",  "Z (\\r l n v.ISNIL l NIL (ISZERO n (CONS v (TAIL l)) (CONS (HEAD l) (r (TAIL l) (PRED n) v))))"},
    {"UPDATE",  "\\f i v.ISNEG i f (SETNTH f (TONAT i) v)"},

    // Equality over lists
    {"LISTEQ",  "Z (\\r eq a b.ISNIL a (ISNIL b) (ISNIL b FALSE (AND (eq (HEAD a) (HEAD b)) (r eq (TAIL a) (TAIL b)))))"},
    {"STREQ",   "LISTEQ NEQ"},
    {"FUNEQ",   "LISTEQ EQ"},

    // Strings
    {"APPEND",  "Z (\\r a b.ISNIL a b (CONS (HEAD a) (r (TAIL a) b)))"},
    {"CONCAT",  "APPEND"},
    {"SNOC",    "\\l v.APPEND l (CONS v NIL)"},
    {"SHOWNAT", "Z (\\r n.NLT n 10 (CONS (NADD 48 n) NIL) "
                "(APPEND (r (NDIV n 10)) (CONS (NADD 48 (NMOD n 10)) NIL)))"},
    {"SHOWINT", "\\a.ISNEG a (CONS 45 (SHOWNAT (NSUB (SND a) (FST a)))) (SHOWNAT (TONAT a))"},
    {"TRUESTR", "CONS 116 (CONS 114 (CONS 117 (CONS 101 NIL)))"},
    {"FALSESTR","CONS 102 (CONS 97 (CONS 108 (CONS 115 (CONS 101 NIL))))"},
    {"SHOWBOOL","\\b.b TRUESTR FALSESTR"},

    // Configuration transformers
    {"SKIP",    "\\c.c"},
    {"SEQ",     "\\f g c.(\\d.OK d (g d) d) (f c)"},
    {"ASSIGN",  "\\i e c.TRIPLE (OK c) (SETNTH (STATE c) i (e (STATE c))) (OUT c)"},
    {"DECLARE", "\\i d c.TRIPLE (OK c) (SETNTH (STATE c) i d) (OUT c)"},
    {"PRINT",   "\\t e c.TRIPLE (OK c) (STATE c) (SNOC (OUT c) (PAIR t (e (STATE c))))"},
    {"IFGUARD", "\\g t e c.g (STATE c) (t c) (e c)"},
    {"ABORT",   "\\c.TRIPLE FALSE (STATE c) (OUT c)"},
    {"RUN",     "\\t s.t (TRIPLE TRUE s NIL)"},
};

} // namespace

const Prelude& Prelude::instance() {
    static const Prelude prelude;
    return prelude;
}

Prelude::Prelude() {
    for (const auto& src : kPrelude) {
        std::string error;
        TermPtr body = readTerm(src.text, &error);
        if (!body) {
            errors.push_back(fmt::format("{}: {}", src.name, error));
            continue;
        }
        for (const auto& ref : combinatorsOf(body)) {
            if (!index.count(ref)) {
                errors.push_back(fmt::format("{}: refers to '{}' before its definition", src.name, ref));
            }
        }
        if (!freeVariables(body).empty()) {
            errors.push_back(fmt::format("{}: definition is not closed", src.name));
        }
        index[src.name] = defs.size();
        defs.push_back(Definition{src.name, body});
    }
}

const Definition* Prelude::find(const std::string& name) const {
    auto it = index.find(name);
    return it == index.end() ? nullptr : &defs[it->second];
}

std::vector<const Definition*> Prelude::closure(const TermPtr& term) const {
    std::vector<bool> needed(defs.size(), false);
    std::vector<std::string> pending;
    for (const auto& n : combinatorsOf(term)) pending.push_back(n);

    while (!pending.empty()) {
        std::string name = pending.back();
        pending.pop_back();
        auto it = index.find(name);
        if (it == index.end() || needed[it->second]) continue;
        needed[it->second] = true;
        for (const auto& n : combinatorsOf(defs[it->second].body)) pending.push_back(n);
    }

    std::vector<const Definition*> result;
    for (size_t i = 0; i < defs.size(); ++i) {
        if (needed[i]) result.push_back(&defs[i]);
    }
    return result;
}

} // namespace gcl::lambda
