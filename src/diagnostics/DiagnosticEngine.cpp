#include "DiagnosticEngine.hpp"
#include "../utils/Levenshtein.hpp"
#include <sstream>
#include <cctype>
#include <algorithm>
#include <fmt/core.h>
#include <fmt/color.h>

namespace gcl {

const char* stageToString(DiagnosticStage stage) {
    switch (stage) {
        case DiagnosticStage::Lexical: return "LexicalError";
        case DiagnosticStage::Syntax: return "SyntaxError";
        case DiagnosticStage::Semantic: return "SemanticError";
        case DiagnosticStage::Translation: return "TranslationError";
    }
    return "Error";
}

const char* diagnosticKindToString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::InvalidCharacter: return "InvalidCharacter";
        case DiagnosticKind::UnterminatedString: return "UnterminatedString";
        case DiagnosticKind::UnexpectedToken: return "UnexpectedToken";
        case DiagnosticKind::UnexpectedEndOfInput: return "UnexpectedEndOfInput";
        case DiagnosticKind::UndeclaredIdentifier: return "UndeclaredIdentifier";
        case DiagnosticKind::Redeclaration: return "Redeclaration";
        case DiagnosticKind::TypeMismatch: return "TypeMismatch";
        case DiagnosticKind::ArityOrRangeMismatch: return "ArityOrRangeMismatch";
        case DiagnosticKind::UnsupportedConstruct: return "UnsupportedConstruct";
        case DiagnosticKind::DepthExceeded: return "DepthExceeded";
    }
    return "Unknown";
}

DiagnosticStage stageOf(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::InvalidCharacter:
        case DiagnosticKind::UnterminatedString:
            return DiagnosticStage::Lexical;
        case DiagnosticKind::UnexpectedToken:
        case DiagnosticKind::UnexpectedEndOfInput:
            return DiagnosticStage::Syntax;
        case DiagnosticKind::UndeclaredIdentifier:
        case DiagnosticKind::Redeclaration:
        case DiagnosticKind::TypeMismatch:
        case DiagnosticKind::ArityOrRangeMismatch:
            return DiagnosticStage::Semantic;
        case DiagnosticKind::UnsupportedConstruct:
        case DiagnosticKind::DepthExceeded:
            return DiagnosticStage::Translation;
    }
    return DiagnosticStage::Syntax;
}

DiagnosticEngine::DiagnosticEngine(std::string source, std::string fname)
    : sourceCode(std::move(source)), filename(std::move(fname)) {
    splitLines();

    keywords = {
        "if", "fi", "while", "end", "print", "skip",
        "true", "false", "and", "or"
    };

    types = {
        "int", "bool", "function"
    };
}

void DiagnosticEngine::splitLines() {
    std::stringstream ss(sourceCode);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
}

std::string DiagnosticEngine::getLine(int lineNum) const {
    if (lineNum > 0 && lineNum <= (int)lines.size()) {
        return lines[lineNum - 1];
    }
    return "";
}

std::string DiagnosticEngine::checkTypo(const std::string& word) const {
    if (word.empty()) return "";
    std::string bestMatch;
    int bestDist = 100;

    auto consider = [&](const std::string& candidate) {
        int dist = utils::levenshtein_distance(word, candidate);
        if (dist < bestDist) {
            bestDist = dist;
            bestMatch = candidate;
        }
    };
    for (const auto& kw : keywords) consider(kw);
    for (const auto& t : types) consider(t);

    // Stricter threshold for short words
    int threshold = (word.length() < 4) ? 1 : 2;

    if (bestDist > 0 && bestDist <= threshold && bestDist < (int)word.length()) {
        return bestMatch;
    }
    return "";
}

void DiagnosticEngine::report(Diagnostic diag) {
    if (diag.stage == DiagnosticStage::Syntax && diag.help.empty()) {
        // 1. The offending token itself may be a misspelled keyword
        std::string suggestion = checkTypo(diag.subject);
        if (!suggestion.empty()) {
            diag.help = fmt::format("Did you mean '{}'?", suggestion);
        } else {
            // 2. Otherwise look at the word right before it
            std::string line = getLine(diag.line);
            int cursor = std::min<int>(diag.column - 2, (int)line.size() - 1);
            while (cursor >= 0 && std::isspace((unsigned char)line[cursor])) cursor--;
            int end = cursor + 1;
            while (cursor >= 0 && (std::isalnum((unsigned char)line[cursor]) || line[cursor] == '_')) cursor--;
            if (end > cursor + 1) {
                std::string prevWord = line.substr(cursor + 1, end - (cursor + 1));
                std::string prevSuggestion = checkTypo(prevWord);
                if (!prevSuggestion.empty()) {
                    diag.help = fmt::format("The word '{}' looks suspicious. Did you mean '{}'?",
                                            prevWord, prevSuggestion);
                }
            }
        }
    }
    records.push_back(std::move(diag));
    if (echo) render(records.back());
}

void DiagnosticEngine::report(DiagnosticKind kind, int line, int column, const std::string& msg) {
    Diagnostic d;
    d.stage = stageOf(kind);
    d.kind = kind;
    d.message = msg;
    d.line = line;
    d.column = column;
    report(std::move(d));
}

std::size_t DiagnosticEngine::count(DiagnosticKind kind) const {
    return std::count_if(records.begin(), records.end(),
                         [kind](const Diagnostic& d) { return d.kind == kind; });
}

std::size_t DiagnosticEngine::count(DiagnosticStage stage) const {
    return std::count_if(records.begin(), records.end(),
                         [stage](const Diagnostic& d) { return d.stage == stage; });
}

void DiagnosticEngine::renderAll() {
    for (const auto& d : records) render(d);
}

void DiagnosticEngine::printHighlightedLine(const std::string& line) {
    std::string word;
    auto flush = [&]() {
        if (word.empty()) return;
        bool isKw = std::find(keywords.begin(), keywords.end(), word) != keywords.end();
        bool isType = std::find(types.begin(), types.end(), word) != types.end();

        if (color && isKw) fmt::print(fg(fmt::color::magenta) | fmt::emphasis::bold, "{}", word);
        else if (color && isType) fmt::print(fg(fmt::color::yellow), "{}", word);
        else fmt::print("{}", word);
        word.clear();
    };
    for (char c : line) {
        if (std::isalnum((unsigned char)c) || c == '_') {
            word += c;
        } else {
            flush();
            fmt::print("{}", c);
        }
    }
    flush();
    fmt::print("\n");
}

void DiagnosticEngine::render(const Diagnostic& diag) {
    auto style = [this](fmt::text_style s) { return color ? s : fmt::text_style{}; };

    fmt::print(style(fg(fmt::color::red) | fmt::emphasis::bold), "error[{}]: ", diagnosticKindToString(diag.kind));
    fmt::print(style(fmt::emphasis::bold), "{}\n", diag.message);

    if (diag.line > 0) {
        fmt::print(style(fg(fmt::color::cornflower_blue)), "   --> {}:{}:{}\n", filename, diag.line, diag.column);
        printContext(diag);
    }

    if (!diag.expected.empty()) {
        std::string list;
        for (size_t i = 0; i < diag.expected.size(); ++i) {
            if (i) list += ", ";
            list += "'" + diag.expected[i] + "'";
        }
        fmt::print(style(fg(fmt::color::cyan)), "   = note: expected one of {}\n", list);
    }
    if (!diag.help.empty()) {
        fmt::print(style(fg(fmt::color::cyan)), "   = help: {}\n", diag.help);
    }
}

void DiagnosticEngine::printContext(const Diagnostic& diag) {
    auto style = [this](fmt::text_style s) { return color ? s : fmt::text_style{}; };
    std::string lineContent = getLine(diag.line);

    std::string lineNumStr = std::to_string(diag.line);
    std::string padding(lineNumStr.length(), ' ');

    fmt::print(style(fg(fmt::color::cornflower_blue)), " {} |\n", padding);
    fmt::print(style(fg(fmt::color::cornflower_blue)), " {} | ", lineNumStr);
    printHighlightedLine(lineContent);
    fmt::print(style(fg(fmt::color::cornflower_blue)), " {} | ", padding);

    for (int i = 1; i < diag.column; i++) fmt::print(" ");

    int len = std::max(1, diag.length);
    for (int i = 0; i < len; i++) fmt::print(style(fg(fmt::color::red) | fmt::emphasis::bold), "^");

    fmt::print(style(fg(fmt::color::red) | fmt::emphasis::bold), " here\n");
}

}
