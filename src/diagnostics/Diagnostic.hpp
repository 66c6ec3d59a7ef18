#pragma once
#include <string>
#include <vector>

namespace gcl {

enum class DiagnosticStage {
    Lexical,
    Syntax,
    Semantic,
    Translation
};

enum class DiagnosticKind {
    // Lexical
    InvalidCharacter,
    UnterminatedString,
    // Syntax
    UnexpectedToken,
    UnexpectedEndOfInput,
    // Semantic
    UndeclaredIdentifier,
    Redeclaration,
    TypeMismatch,
    ArityOrRangeMismatch,
    // Translation
    UnsupportedConstruct,
    DepthExceeded
};

struct Diagnostic {
    DiagnosticStage stage = DiagnosticStage::Syntax;
    DiagnosticKind kind = DiagnosticKind::UnexpectedToken;
    std::string message;
    int line = 0;
    int column = 0;
    int length = 1;
    std::string subject;               // offending lexeme or identifier
    std::vector<std::string> expected; // syntax errors only
    std::string help;
};

const char* stageToString(DiagnosticStage stage);
const char* diagnosticKindToString(DiagnosticKind kind);
DiagnosticStage stageOf(DiagnosticKind kind);

}
