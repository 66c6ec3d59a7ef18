#include <gtest/gtest.h>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "parser/Parser.hpp"
#include "semantics/ContextAnalyzer.hpp"
#include "translator/Translator.hpp"
#include "lambda/LambdaPrinter.hpp"
#include "diagnostics/DiagnosticEngine.hpp"
#include "support/LambdaEvaluator.hpp"

using gcl::test_support::LambdaEvaluator;
using Output = std::vector<std::string>;

static std::string readSample(const std::string& name) {
    std::ifstream t(std::string(GCL_SAMPLES_DIR) + "/" + name);
    if (!t.is_open()) return "";
    std::stringstream buffer;
    buffer << t.rdbuf();
    return buffer.str();
}

class TranslatorTest : public ::testing::Test {
protected:
    // Front end plus translation; null when any stage reports an error.
    std::optional<gcl::Translation> translate(const std::string& code,
                                              gcl::TranslatorOptions options = {}) {
        diag = std::make_unique<gcl::DiagnosticEngine>(code, "<test-input>");
        ast = gcl::parseProgram(code, *diag);
        if (!ast) return std::nullopt;
        gcl::ContextAnalyzer analyzer(*diag);
        if (!analyzer.analyze(*ast)) return std::nullopt;
        gcl::Translator translator(*diag, options);
        return translator.translate(*ast, analyzer.slotCount());
    }

    LambdaEvaluator::Outcome run(const std::string& code) {
        auto translation = translate(code);
        if (!translation) {
            ADD_FAILURE() << "translation failed for: " << code;
            return {};
        }
        return evaluator.run(translation->program);
    }

    Output output(const std::string& code) {
        auto outcome = run(code);
        EXPECT_TRUE(outcome.ok);
        return outcome.output;
    }

    std::unique_ptr<gcl::DiagnosticEngine> diag;
    std::unique_ptr<gcl::Block> ast;
    LambdaEvaluator evaluator;
};

// --- Scenarios ---

TEST_F(TranslatorTest, AssignAndPrintSum) {
    EXPECT_EQ(output("{int x; x := 1+2; print x}"), Output{"3"});
}

TEST_F(TranslatorTest, BooleanConjunction) {
    EXPECT_EQ(output("{bool b; b := true and false; print b}"), Output{"false"});
}

TEST_F(TranslatorTest, UndeclaredIdentifierSkipsTranslation) {
    EXPECT_FALSE(translate("{int y; y := z+1}"));
    EXPECT_EQ(diag->diagnostics().size(), 1u);
    EXPECT_EQ(diag->count(gcl::DiagnosticStage::Translation), 0u);
}

TEST_F(TranslatorTest, WhileLoopTerminates) {
    EXPECT_EQ(output("{int n; n:=0; while n < 3 \xE2\x86\x92 n := n+1 end; print n}"), Output{"3"});
}

// --- Instructions ---

TEST_F(TranslatorTest, SequencingIsLeftToRight) {
    EXPECT_EQ(output("{int x; x := 1; print x; x := x * 10; print x; skip; print x - 15}"),
              (Output{"1", "10", "-5"}));
}

TEST_F(TranslatorTest, VariablesStartAtDefaults) {
    EXPECT_EQ(output("{int x; bool b; function[..1] f; print x; print b; print f}"),
              (Output{"0", "false", "[0, 0]"}));
}

TEST_F(TranslatorTest, FirstTrueGuardWins) {
    EXPECT_EQ(output("{int x; x := 5; if x > 0 --> print 1 [] x > 1 --> print 2 fi}"), Output{"1"});
    EXPECT_EQ(output("{int x; x := 5; if x < 0 --> print 1 [] x > 1 --> print 2 fi}"), Output{"2"});
}

TEST_F(TranslatorTest, IfWithoutTrueGuardAborts) {
    auto outcome = run("{int x; print 1; if x > 0 --> print 2 fi; print 3}");
    EXPECT_FALSE(outcome.ok);
    // Output produced before the fault survives, nothing after it runs
    EXPECT_EQ(outcome.output, Output{"1"});
}

TEST_F(TranslatorTest, WhileWithSeveralGuards) {
    EXPECT_EQ(output(R"(
        {
            int up, down;
            down := 3;
            while down > 0 --> down := down - 1; up := up + 1
            [] up > 5 --> skip
            end;
            print up; print down
        }
    )"), (Output{"3", "0"}));
}

TEST_F(TranslatorTest, NestedWhileLoops) {
    EXPECT_EQ(output(R"(
        {
            int i, j, n;
            while i < 2 -->
                j := 0;
                while j < 2 --> n := n + 1; j := j + 1 end;
                i := i + 1
            end;
            print n
        }
    )"), Output{"4"});
}

TEST_F(TranslatorTest, ShadowedVariablesKeepSeparateStorage) {
    EXPECT_EQ(output("{int x; x := 1; {int x; x := 2; print x}; print x}"), (Output{"2", "1"}));
}

TEST_F(TranslatorTest, InnerBlockResetsOnEntry) {
    EXPECT_EQ(output(R"(
        {
            int k;
            while k < 2 --> { int t; print t; t := 9 }; k := k + 1 end
        }
    )"), (Output{"0", "0"}));
}

// --- Expressions ---

TEST_F(TranslatorTest, ArithmeticAndComparisons) {
    EXPECT_EQ(output("{print 7 - 2 * 4; print -(3 - 5); print 2 <= 2; print 3 <> 3; print !(1 >= 2)}"),
              (Output{"-1", "2", "true", "false", "true"}));
}

TEST_F(TranslatorTest, Strings) {
    EXPECT_EQ(output(R"({int x; x := -4; print "x=" + x; print "ok " + (x < 0); print "a" == "a"})"),
              (Output{"x=-4", "ok true", "true"}));
}

TEST_F(TranslatorTest, FunctionsReadAndUpdate) {
    EXPECT_EQ(output(R"(
        {
            function[..2] f; int i;
            f := 4, 5, 6;
            i := 2;
            print f.i;
            f := f(0 : -1)[1 : 8];
            print f;
            print f.(i + 1);
            print f == (-1, 8, 6)
        }
    )"), (Output{"6", "[-1, 8, 6]", "0", "true"}));
}

TEST_F(TranslatorTest, SingleIntFillsUnitFunction) {
    EXPECT_EQ(output("{function[..0] f; f := 42; print f.0}"), Output{"42"});
}

TEST_F(TranslatorTest, LeadingZerosDoNotCountTowardsLiteralLength) {
    EXPECT_EQ(output("{int x; x := 0000000000000000007; print x; print 0000000000000000000000}"),
              (Output{"7", "0"}));
    EXPECT_FALSE(translate("{int x; x := 1000000000000000000000}"));
    EXPECT_EQ(diag->count(gcl::DiagnosticKind::UnsupportedConstruct), 1u);
}

// --- Properties ---

TEST_F(TranslatorTest, TranslationIsDeterministic) {
    std::string code = "{int n; while n < 2 --> n := n + 1 end; if n == 2 --> print \"done\" fi}";
    auto first = translate(code);
    ASSERT_TRUE(first);
    auto second = translate(code);
    ASSERT_TRUE(second);
    EXPECT_TRUE(gcl::lambda::equals(first->program, second->program));
    EXPECT_EQ(first->slotCount, 1);
}

TEST_F(TranslatorTest, ProgramIsClosed) {
    auto t = translate("{int x; while x < 1 --> x := x + 1 end; print x}");
    ASSERT_TRUE(t);
    EXPECT_TRUE(gcl::lambda::freeVariables(t->program).empty());
    EXPECT_TRUE(gcl::lambda::freeVariables(t->transformer).empty());
}

TEST_F(TranslatorTest, TransformerMapsAnyInitialState) {
    auto t = translate("{int x; x := x + 1; print x}");
    ASSERT_TRUE(t);
    auto outcome = evaluator.run(gcl::lambda::app(t->transformer, t->initialState));
    EXPECT_EQ(outcome.output, Output{"1"});
}

TEST_F(TranslatorTest, DepthExceeded) {
    std::string expr = "1";
    for (int i = 0; i < 40; ++i) expr = "(" + expr + " + 1)";
    gcl::TranslatorOptions options;
    options.maxDepth = 20;
    EXPECT_FALSE(translate("{int x; x := " + expr + "}", options));
    ASSERT_EQ(diag->count(gcl::DiagnosticKind::DepthExceeded), 1u);
    EXPECT_EQ(diag->diagnostics().back().stage, gcl::DiagnosticStage::Translation);
}

TEST_F(TranslatorTest, NumeralLimit) {
    gcl::TranslatorOptions options;
    options.maxNumeral = 1000;
    EXPECT_FALSE(translate("{int x; x := 1001}", options));
    EXPECT_EQ(diag->count(gcl::DiagnosticKind::UnsupportedConstruct), 1u);
    EXPECT_TRUE(translate("{int x; x := 1000}", options));
}

TEST_F(TranslatorTest, PrintedFormulaUsesPrelude) {
    auto t = translate("{int x; x := 1+2; print x}");
    ASSERT_TRUE(t);
    gcl::lambda::PrintOptions opts;
    opts.ascii = true;
    std::string text = gcl::lambda::LambdaPrinter(opts).printProgram(t->program);
    EXPECT_NE(text.find("\nmain = ((RUN "), std::string::npos);
    EXPECT_NE(text.find("\nADD = "), std::string::npos);
}

// --- Samples ---

struct SampleCase {
    const char* file;
    Output expected;
};

TEST_F(TranslatorTest, File_Samples) {
    const std::vector<SampleCase> cases = {
        {"arithmetic.gcl", {"3", "-7", "7"}},
        {"loop.gcl", {"3"}},
        {"factorial.gcl", {"24"}},
        {"functions.gcl", {"20", "[10, 99, 30]", "0"}},
        {"strings.gcl", {"x = -12", "negative: true", "tab\tand \"quotes\""}},
        {"scopes.gcl", {"true", "1", "one"}},
    };
    for (const auto& c : cases) {
        std::string code = readSample(c.file);
        ASSERT_FALSE(code.empty()) << c.file;
        EXPECT_EQ(output(code), c.expected) << c.file;
    }
}
