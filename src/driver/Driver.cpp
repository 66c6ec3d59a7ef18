#include "Driver.hpp"
#include "../lexer/lexer.hpp"
#include "../parser/Parser.hpp"
#include "../semantics/ContextAnalyzer.hpp"
#include "../translator/Translator.hpp"
#include "../lambda/LambdaPrinter.hpp"
#include "../diagnostics/DiagnosticEngine.hpp"
#include "../ast/ASTPrinter.hpp"

#include <fstream>
#include <sstream>
#include <fmt/core.h>
#include <fmt/color.h>

namespace gcl {

Driver::Driver(CompilerOptions opts) : options(std::move(opts)) {}
Driver::~Driver() {}

bool Driver::readFile(const std::string& path, std::string& out) {
    std::ifstream t(path, std::ios::binary);
    if (!t.is_open()) return false;
    std::stringstream buffer;
    buffer << t.rdbuf();
    out = buffer.str();
    return true;
}

bool Driver::writeOutput(const std::string& formula) {
    if (options.outputPath.empty()) {
        fmt::print("{}", formula);
        return true;
    }
    std::ofstream f(options.outputPath, std::ios::binary);
    if (!f.is_open()) return false;
    f << formula;
    return static_cast<bool>(f);
}

int Driver::compile() {
    // 1. Read Source
    std::string source;
    if (!readFile(options.inputFile, source)) {
        fmt::print(fg(fmt::color::red), "[ERROR] Could not read file: {}\n", options.inputFile);
        return 1;
    }

    DiagnosticEngine diag(source, options.inputFile);
    diag.setColor(options.color);
    diag.setEcho(true);

    std::string formula;
    if (!run(source, diag, formula)) {
        fmt::print(fg(fmt::color::red), "[ERROR] {} error(s) in {}\n", diag.diagnostics().size(), options.inputFile);
        return 1;
    }

    if (options.checkOnly) {
        fmt::print(fg(fmt::color::green) | fmt::emphasis::bold, "[SUCCESS] {} is well formed.\n", options.inputFile);
        return 0;
    }

    if (!writeOutput(formula)) {
        fmt::print(fg(fmt::color::red), "[ERROR] Could not write file: {}\n", options.outputPath);
        return 1;
    }
    if (!options.outputPath.empty()) {
        fmt::print(fg(fmt::color::green) | fmt::emphasis::bold, "[SUCCESS] Wrote {}\n", options.outputPath);
    }
    return 0;
}

bool Driver::run(const std::string& source, DiagnosticEngine& diag, std::string& formula) {
    formula.clear();

    if (options.debugLexer) runLexer(source);

    // 1. Parser
    auto ast = runParser(source, diag);
    if (!ast) return false;

    // 2. Context Analysis
    int slotCount = 0;
    bool wellFormed = runAnalyzer(*ast, diag, slotCount);

    if (options.debugParser && diag.count(DiagnosticKind::DepthExceeded) > 0) {
        fmt::print("\n[INFO] AST too deeply nested to print.\n");
    } else if (options.debugParser) {
        fmt::print("\n[DEBUG] AST Structure:\n");
        ASTPrinter printer;
        fmt::print("{}\n", printer.print(*ast));
    }
    if (!wellFormed) return false;

    if (options.checkOnly) return true;

    // 3. Translation
    return runTranslator(*ast, slotCount, diag, formula);
}

void Driver::runLexer(const std::string& source) {
    fmt::print("[INFO] Token stream:\n");
    // Errors surface again, with context, when the parser rescans
    DiagnosticEngine scratch(source, options.inputFile);
    Lexer lexer(source, scratch);
    for (const Token& tok : lexer.tokenize()) {
        fmt::print(fg(fmt::color::gray), "[DEBUG] {}:{} {} '{}'\n",
                   tok.line, tok.column, tokenKindToString(tok.kind), tok.text);
    }
}

std::unique_ptr<Block> Driver::runParser(const std::string& source, DiagnosticEngine& diag) {
    if (options.debugParser) fmt::print("[INFO] Running Parser...\n");
    auto ast = parseProgram(source, diag);
    if (ast && options.debugParser) fmt::print(fg(fmt::color::green), "[SUCCESS] Parsing Successful.\n");
    return ast;
}

bool Driver::runAnalyzer(const Block& ast, DiagnosticEngine& diag, int& slotCount) {
    if (options.debugSema) fmt::print("[INFO] Running Context Analysis...\n");

    ContextAnalyzer analyzer(diag, options.debugSema, options.maxNesting);
    if (!analyzer.analyze(ast)) return false;
    slotCount = analyzer.slotCount();

    if (options.debugSema) fmt::print(fg(fmt::color::green), "[SUCCESS] Context Verified.\n");
    return true;
}

bool Driver::runTranslator(const Block& ast, int slotCount, DiagnosticEngine& diag, std::string& formula) {
    if (options.debugTranslator) fmt::print("[INFO] Running Translator...\n");

    TranslatorOptions topts;
    topts.maxDepth = options.maxDepth;
    topts.maxNumeral = options.maxNumeral;
    topts.debug = options.debugTranslator;

    Translator translator(diag, topts);
    auto translation = translator.translate(ast, slotCount);
    if (!translation) return false;

    lambda::PrintOptions popts;
    popts.ascii = options.asciiLambda;
    popts.inlineCombinators = options.inlineCombinators;
    popts.emitPrelude = options.emitPrelude;
    formula = lambda::LambdaPrinter(popts).printProgram(translation->program);

    if (options.debugTranslator) fmt::print(fg(fmt::color::green), "[SUCCESS] Translation complete.\n");
    return true;
}

} // namespace gcl
