#include "LambdaReader.hpp"
#include <cctype>
#include <fmt/core.h>

namespace gcl::lambda {

namespace {

class Reader {
public:
    explicit Reader(const std::string& t) : text(t) {}

    TermPtr readAll() {
        TermPtr t = term();
        if (!t) return nullptr;
        skipSpace();
        if (pos < text.size()) return fail("trailing input");
        return t;
    }

    std::string error;

private:
    const std::string& text;
    size_t pos = 0;

    TermPtr fail(const std::string& what) {
        if (error.empty()) error = fmt::format("{} at offset {}", what, pos);
        return nullptr;
    }

    void skipSpace() {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
    }

    bool atLambda() {
        skipSpace();
        if (pos < text.size() && text[pos] == '\\') return true;
        return text.compare(pos, 2, "\xCE\xBB") == 0;
    }

    bool atAtomStart() {
        skipSpace();
        if (pos >= text.size()) return false;
        char c = text[pos];
        return c == '(' || std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    std::string name() {
        skipSpace();
        size_t start = pos;
        while (pos < text.size() &&
               (std::isalnum(static_cast<unsigned char>(text[pos])) || text[pos] == '_')) pos++;
        return text.substr(start, pos - start);
    }

    TermPtr abstraction() {
        pos += text[pos] == '\\' ? 1 : 2;
        std::vector<std::string> params;
        for (;;) {
            skipSpace();
            if (pos < text.size() && text[pos] == '.') break;
            std::string p = name();
            if (p.empty()) return fail("expected parameter name");
            params.push_back(p);
        }
        if (params.empty()) return fail("abstraction without parameters");
        pos++; // '.'
        TermPtr body = term();
        if (!body) return nullptr;
        return lam(params, body);
    }

    TermPtr term() {
        if (atLambda()) return abstraction();

        TermPtr result = atom();
        if (!result) return nullptr;
        for (;;) {
            // A trailing abstraction extends to the end of the enclosing term
            if (atLambda()) {
                TermPtr arg = abstraction();
                if (!arg) return nullptr;
                return app(result, arg);
            }
            if (!atAtomStart()) return result;
            TermPtr arg = atom();
            if (!arg) return nullptr;
            result = app(result, arg);
        }
    }

    TermPtr atom() {
        skipSpace();
        if (pos >= text.size()) return fail("unexpected end of term");

        char c = text[pos];
        if (c == '(') {
            pos++;
            TermPtr inner = term();
            if (!inner) return nullptr;
            skipSpace();
            if (pos >= text.size() || text[pos] != ')') return fail("expected ')'");
            pos++;
            return inner;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            std::string digits = name();
            for (char d : digits) {
                if (!std::isdigit(static_cast<unsigned char>(d))) return fail("malformed numeral");
            }
            if (digits.size() > 9) return fail("numeral too large");
            return num(static_cast<unsigned>(std::stoul(digits)));
        }
        std::string n = name();
        if (n.empty()) return fail(fmt::format("unexpected character '{}'", c));
        if (std::isupper(static_cast<unsigned char>(n[0]))) return comb(n);
        return var(n);
    }
};

} // namespace

TermPtr readTerm(const std::string& text, std::string* error) {
    Reader reader(text);
    TermPtr result = reader.readAll();
    if (!result && error) *error = reader.error;
    return result;
}

} // namespace gcl::lambda
