#pragma once
#include <memory>
#include <string>
#include "../ast/ASTNode.hpp"

namespace gcl {

class DiagnosticEngine;
class Lexer;

// Parses one GCL program. Returns null after the first lexical or syntax
// error; the error is left in `diag`.
std::unique_ptr<Block> parseProgram(Lexer& lexer, DiagnosticEngine& diag);
std::unique_ptr<Block> parseProgram(const std::string& source, DiagnosticEngine& diag);

} // namespace gcl
