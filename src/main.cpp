#include <cstdlib>
#include <string>
#include <fmt/core.h>
#include <fmt/color.h>
#include "driver/Driver.hpp"

namespace {

void printUsage() {
    fmt::print(
        "Usage: gclc [options] <file.gcl>\n"
        "  -o <file>          write the formula to <file> instead of stdout\n"
        "  --tokens           dump the token stream\n"
        "  --ast              dump the annotated AST\n"
        "  --sema             log context analysis\n"
        "  --trace            log translation\n"
        "  --check            stop after context analysis\n"
        "  --inline           inline every combinator\n"
        "  --ascii            use '\\' instead of 'λ'\n"
        "  --no-prelude       omit prelude definitions\n"
        "  --max-depth <n>    translation nesting limit\n"
        "  --max-nesting <n>  analysis nesting limit\n"
        "  --no-color         plain diagnostics\n");
}

bool parseCount(const char* text, int& out) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (!end || *end != '\0' || value <= 0 || value > 1000000) return false;
    out = static_cast<int>(value);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    gcl::CompilerOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "-o") {
            if (++i >= argc) {
                fmt::print(stderr, "Error: -o expects a file name\n");
                return 2;
            }
            options.outputPath = argv[i];
        } else if (arg == "--tokens") {
            options.debugLexer = true;
        } else if (arg == "--ast") {
            options.debugParser = true;
        } else if (arg == "--sema") {
            options.debugSema = true;
        } else if (arg == "--trace") {
            options.debugTranslator = true;
        } else if (arg == "--check") {
            options.checkOnly = true;
        } else if (arg == "--inline") {
            options.inlineCombinators = true;
        } else if (arg == "--ascii") {
            options.asciiLambda = true;
        } else if (arg == "--no-prelude") {
            options.emitPrelude = false;
        } else if (arg == "--no-color") {
            options.color = false;
        } else if (arg == "--max-depth") {
            if (++i >= argc || !parseCount(argv[i], options.maxDepth)) {
                fmt::print(stderr, "Error: --max-depth expects a positive number\n");
                return 2;
            }
        } else if (arg == "--max-nesting") {
            if (++i >= argc || !parseCount(argv[i], options.maxNesting)) {
                fmt::print(stderr, "Error: --max-nesting expects a positive number\n");
                return 2;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            fmt::print(stderr, "Error: unknown option '{}'\n", arg);
            printUsage();
            return 2;
        } else if (options.inputFile.empty()) {
            options.inputFile = arg;
        } else {
            fmt::print(stderr, "Error: more than one input file\n");
            return 2;
        }
    }

    if (options.inputFile.empty()) {
        printUsage();
        return 2;
    }

    gcl::Driver driver(options);
    return driver.compile();
}
