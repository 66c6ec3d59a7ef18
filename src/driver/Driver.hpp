#pragma once
#include "CompilerOptions.hpp"
#include <memory>
#include <string>

namespace gcl {
    class Block;
    class DiagnosticEngine;
}

namespace gcl {

class Driver {
public:
    Driver(CompilerOptions opts);
    ~Driver();

    // Reads options.inputFile, runs every stage and writes the formula.
    // Returns the process exit code.
    int compile();

    // Runs the pipeline over `source`. On success `formula` holds the
    // printed program (empty with checkOnly).
    bool run(const std::string& source, DiagnosticEngine& diag, std::string& formula);

private:
    CompilerOptions options;

    // Pipeline Stages
    void runLexer(const std::string& source);
    std::unique_ptr<Block> runParser(const std::string& source, DiagnosticEngine& diag);
    bool runAnalyzer(const Block& ast, DiagnosticEngine& diag, int& slotCount);
    bool runTranslator(const Block& ast, int slotCount, DiagnosticEngine& diag, std::string& formula);

    // Helpers
    bool readFile(const std::string& path, std::string& out);
    bool writeOutput(const std::string& formula);
};

}
