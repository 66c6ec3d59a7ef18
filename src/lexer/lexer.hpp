#pragma once
#include "tokens.hpp"
#include <string>
#include <vector>

namespace gcl {

class DiagnosticEngine;

// Cursor shared with the flex scanner through yyextra.
struct ScanState {
    int line = 1;
    int column = 1;
};

// Lazy token stream over one source text. Each next() scans exactly one
// token; reset() rewinds to the first byte. After END_OF_FILE or a lexical
// error every further call yields END_OF_FILE.
class Lexer {
public:
    Lexer(std::string source, DiagnosticEngine& diag);
    ~Lexer();

    Lexer(const Lexer&) = delete;
    Lexer& operator=(const Lexer&) = delete;

    Token next();
    void reset();

    // Rewinds, then scans the whole input. The last element is END_OF_FILE,
    // or UNKNOWN when scanning stopped on a lexical error.
    std::vector<Token> tokenize();

    const Token& lastToken() const { return last; }
    bool failed() const { return hasFailed; }

private:
    std::string source;
    DiagnosticEngine& diag;
    ScanState state;
    void* scanner = nullptr; // yyscan_t
    Token last;
    bool finished = false;
    bool hasFailed = false;

    void open();
    void close();
    void reportError(const Token& tok);
};

} // namespace gcl
