#pragma once
#include <string>

namespace gcl {

struct CompilerOptions {
    std::string inputFile;
    std::string outputPath; // empty: stdout

    bool debugLexer = false;
    bool debugParser = false;
    bool debugSema = false;
    bool debugTranslator = false;

    bool checkOnly = false;

    // Output format
    bool inlineCombinators = false;
    bool asciiLambda = false;
    bool emitPrelude = true;

    int maxDepth = 256;    // translator
    int maxNesting = 1000; // context analyzer
    unsigned maxNumeral = 100000;

    bool color = true;
};

}
