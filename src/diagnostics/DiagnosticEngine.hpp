#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "Diagnostic.hpp"

namespace gcl {

class DiagnosticEngine {
public:
    DiagnosticEngine(std::string sourceCode, std::string filename = "<input>");

    // Records are kept in report order. With echo enabled each record is
    // rendered as soon as it arrives.
    void report(Diagnostic diag);
    void report(DiagnosticKind kind, int line, int column, const std::string& msg);

    bool hasErrors() const { return !records.empty(); }
    const std::vector<Diagnostic>& diagnostics() const { return records; }
    std::size_t count(DiagnosticKind kind) const;
    std::size_t count(DiagnosticStage stage) const;
    void clear() { records.clear(); }

    void setEcho(bool on) { echo = on; }
    void setColor(bool on) { color = on; }

    void renderAll();
    void render(const Diagnostic& diag);

    // Closest GCL keyword within a small edit distance, or "".
    std::string checkTypo(const std::string& word) const;

    const std::string& sourceName() const { return filename; }

private:
    std::string sourceCode;
    std::string filename;
    std::vector<std::string> lines;
    std::vector<std::string> keywords;
    std::vector<std::string> types;
    std::vector<Diagnostic> records;
    bool echo = false;
    bool color = true;

    void splitLines();
    std::string getLine(int lineNum) const;

    void printContext(const Diagnostic& diag);
    void printHighlightedLine(const std::string& line);
};

}
