#include <gtest/gtest.h>
#include <string>
#include "lambda/LambdaExpr.hpp"
#include "lambda/LambdaReader.hpp"
#include "lambda/LambdaPrinter.hpp"
#include "lambda/Prelude.hpp"
#include "support/LambdaEvaluator.hpp"

using namespace gcl::lambda;
using gcl::test_support::LambdaEvaluator;

namespace {

TermPtr read(const std::string& text) {
    std::string error;
    TermPtr t = readTerm(text, &error);
    EXPECT_TRUE(t) << error;
    return t;
}

TermPtr integer(long long v) {
    return v >= 0 ? app(comb("PAIR"), {num(static_cast<unsigned>(v)), num(0)})
                  : app(comb("PAIR"), {num(0), num(static_cast<unsigned>(-v))});
}

} // namespace

TEST(PreludeTest, EveryDefinitionIsClosedAndOrdered) {
    const Prelude& prelude = Prelude::instance();
    for (const auto& problem : prelude.problems()) ADD_FAILURE() << problem;
    EXPECT_TRUE(prelude.contains("Z"));
    EXPECT_TRUE(prelude.contains("RUN"));
    EXPECT_FALSE(prelude.contains("main"));
}

TEST(PreludeTest, ClosureFollowsDependencies) {
    auto needed = Prelude::instance().closure(comb("NOT"));
    ASSERT_EQ(needed.size(), 3u);
    EXPECT_EQ(needed[0]->name, "TRUE");
    EXPECT_EQ(needed[1]->name, "FALSE");
    EXPECT_EQ(needed[2]->name, "NOT");
}

TEST(LambdaTermTest, BuildersAndEquality) {
    TermPtr a = lam(std::vector<std::string>{"x", "y"}, app(var("x"), var("y")));
    TermPtr b = lam("x", lam("y", app(var("x"), var("y"))));
    EXPECT_TRUE(equals(a, b));
    EXPECT_FALSE(equals(a, lam(std::vector<std::string>{"x", "z"}, app(var("x"), var("z")))));
    EXPECT_FALSE(equals(num(1), num(2)));
    EXPECT_TRUE(equals(app(comb("F"), {num(1), num(2)}), app(app(comb("F"), num(1)), num(2))));
}

TEST(LambdaTermTest, FreeVariablesAndCombinators) {
    TermPtr t = lam("s", app(comb("NTH"), {var("s"), var("k"), num(0)}));
    auto free = freeVariables(t);
    EXPECT_EQ(free.size(), 1u);
    EXPECT_TRUE(free.count("k"));
    EXPECT_EQ(combinatorsOf(t).count("NTH"), 1u);
}

TEST(LambdaReaderTest, ReadsApplicationsAndAbstractions) {
    TermPtr t = read("\\f x.f (f x)");
    EXPECT_TRUE(equals(t, lam(std::vector<std::string>{"f", "x"}, app(var("f"), app(var("f"), var("x"))))));

    TermPtr u = read("PAIR 3 \xCE\xBBy.y");
    EXPECT_TRUE(equals(u, app(comb("PAIR"), {num(3), lam("y", var("y"))})));
}

TEST(LambdaReaderTest, RejectsMalformedInput) {
    std::string error;
    EXPECT_FALSE(readTerm("(\\x.x", &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(readTerm("\\.x"));
    EXPECT_FALSE(readTerm("x )"));
}

TEST(LambdaPrinterTest, ParenthesisesApplications) {
    LambdaPrinter printer;
    TermPtr t = app(lam("x", var("x")), lam("y", app(var("y"), var("y"))));
    EXPECT_EQ(printer.print(t), "((\xCE\xBBx.x) \xCE\xBBy.(y y))");
}

TEST(LambdaPrinterTest, AsciiNumerals) {
    PrintOptions opts;
    opts.ascii = true;
    LambdaPrinter printer(opts);
    EXPECT_EQ(printer.print(num(0)), "\\f.\\x.x");
    EXPECT_EQ(printer.print(num(2)), "\\f.\\x.(f (f x))");
}

TEST(LambdaPrinterTest, PrintedTermsReadBack) {
    PrintOptions opts;
    opts.ascii = true;
    LambdaPrinter printer(opts);
    TermPtr t = lam(std::vector<std::string>{"a", "b"}, app(app(comb("AND"), var("a")), lam("c", app(var("c"), var("b")))));
    EXPECT_TRUE(equals(read(printer.print(t)), t));
}

TEST(LambdaPrinterTest, ProgramListsUsedDefinitions) {
    PrintOptions opts;
    opts.ascii = true;
    std::string text = LambdaPrinter(opts).printProgram(app(comb("NOT"), comb("TRUE")));
    EXPECT_EQ(text, "TRUE = \\t.\\f.t\nFALSE = \\t.\\f.f\nNOT = \\b.((b FALSE) TRUE)\nmain = (NOT TRUE)\n");

    opts.emitPrelude = false;
    EXPECT_EQ(LambdaPrinter(opts).printProgram(comb("TRUE")), "main = TRUE\n");
}

TEST(LambdaPrinterTest, InlineModeIsClosedLambda) {
    PrintOptions opts;
    opts.ascii = true;
    opts.inlineCombinators = true;
    std::string text = LambdaPrinter(opts).print(app(comb("NOT"), comb("TRUE")));
    EXPECT_EQ(text, "((\\b.((b \\t.\\f.f) \\t.\\f.t)) \\t.\\f.t)");
    TermPtr back = read(text);
    EXPECT_TRUE(combinatorsOf(back).empty());
}

// --- Combinators, checked with the call-by-need evaluator ---

class CombinatorTest : public ::testing::Test {
protected:
    long long evalInt(const TermPtr& t) { return eval.toInt(eval.evaluate(t)); }
    bool evalBool(const TermPtr& t) { return eval.toBool(eval.evaluate(t)); }

    LambdaEvaluator eval;
};

TEST_F(CombinatorTest, IntegerArithmetic) {
    EXPECT_EQ(evalInt(app(comb("ADD"), {integer(2), integer(3)})), 5);
    EXPECT_EQ(evalInt(app(comb("SUB"), {integer(2), integer(5)})), -3);
    EXPECT_EQ(evalInt(app(comb("MUL"), {integer(-4), integer(3)})), -12);
    EXPECT_EQ(evalInt(app(comb("MUL"), {integer(-4), integer(-3)})), 12);
    EXPECT_EQ(evalInt(app(comb("NEG"), integer(7))), -7);
}

TEST_F(CombinatorTest, IntegerComparisons) {
    EXPECT_TRUE(evalBool(app(comb("LT"), {integer(-1), integer(0)})));
    EXPECT_FALSE(evalBool(app(comb("LT"), {integer(2), integer(2)})));
    EXPECT_TRUE(evalBool(app(comb("LEQ"), {integer(2), integer(2)})));
    EXPECT_TRUE(evalBool(app(comb("GT"), {integer(3), integer(-3)})));
    EXPECT_TRUE(evalBool(app(comb("GEQ"), {integer(0), integer(0)})));
    // (5, 2) and (3, 0) both stand for 3
    EXPECT_TRUE(evalBool(app(comb("EQ"), {app(comb("PAIR"), {num(5), num(2)}), integer(3)})));
}

TEST_F(CombinatorTest, BooleanLogic) {
    EXPECT_FALSE(evalBool(app(comb("AND"), {comb("TRUE"), comb("FALSE")})));
    EXPECT_TRUE(evalBool(app(comb("OR"), {comb("FALSE"), comb("TRUE")})));
    EXPECT_TRUE(evalBool(app(comb("BEQ"), {comb("FALSE"), comb("FALSE")})));
    EXPECT_FALSE(evalBool(app(comb("BEQ"), {comb("TRUE"), comb("FALSE")})));
}

TEST_F(CombinatorTest, ListIndexing) {
    TermPtr list = app(comb("CONS"), {integer(10), app(comb("CONS"), {integer(20), comb("NIL")})});
    EXPECT_EQ(evalInt(app(comb("INDEX"), {list, integer(1)})), 20);
    EXPECT_EQ(evalInt(app(comb("INDEX"), {list, integer(2)})), 0);
    EXPECT_EQ(evalInt(app(comb("INDEX"), {list, integer(-1)})), 0);

    TermPtr updated = app(comb("UPDATE"), {list, integer(0), integer(7)});
    EXPECT_EQ(evalInt(app(comb("INDEX"), {updated, integer(0)})), 7);
    EXPECT_EQ(evalInt(app(comb("INDEX"), {updated, integer(1)})), 20);

    TermPtr unchanged = app(comb("UPDATE"), {list, integer(5), integer(7)});
    EXPECT_EQ(eval.toList(eval.evaluate(unchanged)).size(), 2u);
}

TEST_F(CombinatorTest, ShowIntegers) {
    EXPECT_EQ(eval.toText(eval.evaluate(app(comb("SHOWINT"), integer(0)))), "0");
    EXPECT_EQ(eval.toText(eval.evaluate(app(comb("SHOWINT"), integer(105)))), "105");
    EXPECT_EQ(eval.toText(eval.evaluate(app(comb("SHOWINT"), integer(-42)))), "-42");
    EXPECT_EQ(eval.toText(eval.evaluate(app(comb("SHOWBOOL"), comb("FALSE")))), "false");
}

TEST_F(CombinatorTest, ListEquality) {
    TermPtr ab = app(comb("CONS"), {num(97), app(comb("CONS"), {num(98), comb("NIL")})});
    TermPtr a = app(comb("CONS"), {num(97), comb("NIL")});
    EXPECT_TRUE(evalBool(app(comb("STREQ"), {ab, ab})));
    EXPECT_FALSE(evalBool(app(comb("STREQ"), {ab, a})));
    EXPECT_FALSE(evalBool(app(comb("STREQ"), {a, ab})));
}
