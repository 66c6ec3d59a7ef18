#include "lexer.hpp"
#include "../diagnostics/DiagnosticEngine.hpp"
#include "scanner.hpp"
#include <fmt/core.h>

gcl::Token gcl_next_token(yyscan_t yyscanner);

namespace gcl {

Lexer::Lexer(std::string src, DiagnosticEngine& d)
    : source(std::move(src)), diag(d) {
    open();
}

Lexer::~Lexer() {
    close();
}

void Lexer::open() {
    state = ScanState{};
    yylex_init_extra(&state, &scanner);
    yy_scan_bytes(source.data(), static_cast<int>(source.size()), scanner);
}

void Lexer::close() {
    if (scanner) {
        yylex_destroy(scanner);
        scanner = nullptr;
    }
}

void Lexer::reset() {
    close();
    open();
    last = Token{};
    finished = false;
    hasFailed = false;
}

Token Lexer::next() {
    if (finished) {
        Token eof{TokenKind::END_OF_FILE, "", state.line, state.column};
        last = eof;
        return eof;
    }

    Token tok = gcl_next_token(scanner);
    if (tok.kind == TokenKind::UNKNOWN) {
        reportError(tok);
        hasFailed = true;
        finished = true;
    } else if (tok.kind == TokenKind::END_OF_FILE) {
        finished = true;
    }
    last = tok;
    return tok;
}

std::vector<Token> Lexer::tokenize() {
    reset();
    std::vector<Token> tokens;
    for (;;) {
        Token tok = next();
        tokens.push_back(tok);
        if (tok.kind == TokenKind::END_OF_FILE || tok.kind == TokenKind::UNKNOWN) break;
    }
    return tokens;
}

void Lexer::reportError(const Token& tok) {
    Diagnostic d;
    d.stage = DiagnosticStage::Lexical;
    d.line = tok.line;
    d.column = tok.column;
    d.subject = tok.text;
    if (!tok.text.empty() && tok.text[0] == '"') {
        d.kind = DiagnosticKind::UnterminatedString;
        d.message = "Unterminated string literal";
        d.length = static_cast<int>(tok.text.size());
    } else {
        d.kind = DiagnosticKind::InvalidCharacter;
        d.message = fmt::format("Unexpected character '{}'", tok.text);
    }
    diag.report(std::move(d));
}

} // namespace gcl
