#pragma once

#include <string>

namespace gcl {

enum class TokenKind {
    END_OF_FILE = 0,

    // --- Keywords ---
    KW_INT, KW_BOOL, KW_FUNCTION,
    KW_IF, KW_FI, KW_WHILE, KW_END,
    KW_PRINT, KW_SKIP,
    KW_TRUE, KW_FALSE,
    KW_AND, KW_OR,

    // --- Punctuation ---
    LBRACE, RBRACE,       // { }
    LBRACKET, RBRACKET,   // [ ]
    LPAREN, RPAREN,       // ( )
    SEMICOLON, COLON,     // ; :
    COMMA,                // ,
    SO_FORTH,             // ..
    APP,                  // .
    ASSIGN,               // :=
    ARROW,                // --> or →
    GUARD,                // []

    // --- Operators ---
    PLUS, MINUS, MULT,
    NOT,                  // !
    EQEQ, NOTEQ,          // == <>
    LT, GT, LTEQ, GTEQ,   // < > <= >=

    // --- Literals ---
    IDENTIFIER,
    INTEGER,
    STRING_LITERAL,

    // --- Error ---
    UNKNOWN
};

// One scanned lexeme. Positions are 1-based.
struct Token {
    TokenKind kind = TokenKind::END_OF_FILE;
    std::string text;
    int line = 0;
    int column = 0;
};

// Display names follow the GCL course convention (TkId, TkNum, ...).
inline const char* tokenKindToString(TokenKind k) {
    switch (k) {
        case TokenKind::END_OF_FILE: return "EOF";
        case TokenKind::KW_INT: return "TkInt";
        case TokenKind::KW_BOOL: return "TkBool";
        case TokenKind::KW_FUNCTION: return "TkFunction";
        case TokenKind::KW_IF: return "TkIf";
        case TokenKind::KW_FI: return "TkFi";
        case TokenKind::KW_WHILE: return "TkWhile";
        case TokenKind::KW_END: return "TkEnd";
        case TokenKind::KW_PRINT: return "TkPrint";
        case TokenKind::KW_SKIP: return "TkSkip";
        case TokenKind::KW_TRUE: return "TkTrue";
        case TokenKind::KW_FALSE: return "TkFalse";
        case TokenKind::KW_AND: return "TkAnd";
        case TokenKind::KW_OR: return "TkOr";
        case TokenKind::LBRACE: return "TkOBlock";
        case TokenKind::RBRACE: return "TkCBlock";
        case TokenKind::LBRACKET: return "TkOBracket";
        case TokenKind::RBRACKET: return "TkCBracket";
        case TokenKind::LPAREN: return "TkOpenPar";
        case TokenKind::RPAREN: return "TkClosePar";
        case TokenKind::SEMICOLON: return "TkSemicolon";
        case TokenKind::COLON: return "TkTwoPoints";
        case TokenKind::COMMA: return "TkComma";
        case TokenKind::SO_FORTH: return "TkSoForth";
        case TokenKind::APP: return "TkApp";
        case TokenKind::ASSIGN: return "TkAsig";
        case TokenKind::ARROW: return "TkArrow";
        case TokenKind::GUARD: return "TkGuard";
        case TokenKind::PLUS: return "TkPlus";
        case TokenKind::MINUS: return "TkMinus";
        case TokenKind::MULT: return "TkMult";
        case TokenKind::NOT: return "TkNot";
        case TokenKind::EQEQ: return "TkEqual";
        case TokenKind::NOTEQ: return "TkNEqual";
        case TokenKind::LT: return "TkLess";
        case TokenKind::GT: return "TkGreater";
        case TokenKind::LTEQ: return "TkLeq";
        case TokenKind::GTEQ: return "TkGeq";
        case TokenKind::IDENTIFIER: return "TkId";
        case TokenKind::INTEGER: return "TkNum";
        case TokenKind::STRING_LITERAL: return "TkString";
        case TokenKind::UNKNOWN: return "TkError";
    }
    return "TOKEN";
}

} // namespace gcl
