#include "Parser.hpp"
#include "parser.hpp"
#include "../lexer/lexer.hpp"
#include "../diagnostics/DiagnosticEngine.hpp"

namespace gcl {

std::unique_ptr<Block> parseProgram(Lexer& lexer, DiagnosticEngine& diag) {
    std::unique_ptr<Block> root;
    parser p(lexer, diag, root);
    int result = p.parse();
    if (result != 0 || lexer.failed()) return nullptr;
    return root;
}

std::unique_ptr<Block> parseProgram(const std::string& source, DiagnosticEngine& diag) {
    Lexer lexer(source, diag);
    return parseProgram(lexer, diag);
}

} // namespace gcl
