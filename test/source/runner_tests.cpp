#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <runner/runner.hpp>

#include "testutils.hpp"

namespace
{
auto assert_output(std::string_view input, std::string_view expected) -> void
{
    const auto result = run_source(input);
    EXPECT_EQ(result.status, run_status::success) << input << "\n" << result.err;
    EXPECT_EQ(result.out, expected) << input;
    EXPECT_TRUE(result.err.empty()) << result.err;
}
}  // namespace

// NOLINTBEGIN(*-magic-numbers)
TEST(runner, exitCodes)
{
    EXPECT_EQ(exit_code(run_status::success), 0);
    EXPECT_EQ(exit_code(run_status::static_error), 65);
    EXPECT_EQ(exit_code(run_status::runtime_failure), 70);
}

TEST(runner, blockScopingShadows)
{
    assert_output("var a = 1; { var a = 2; print a; } print a;", "2.00\n1.00\n");
    assert_output("var a = 1; { a = 2; } print a;", "2.00\n");
    assert_output("var a; a = 3; print a;", "3.00\n");
}

TEST(runner, closuresCaptureTheirScope)
{
    assert_output(R"(
fun makeCounter() {
    var i = 0;
    fun count() {
        i = i + 1;
        print i;
    }
    return count;
}
var counter = makeCounter();
counter();
counter();
)",
                  "1.00\n2.00\n");
    assert_output(R"(
fun makeAdder(n) {
    fun add(x) { return x + n; }
    return add;
}
var addTwo = makeAdder(2);
var addTen = makeAdder(10);
print addTwo(1);
print addTen(1);
)",
                  "3.00\n11.00\n");
}

TEST(runner, functionsAreDefinedInTheCurrentScope)
{
    assert_output("{ fun local() { return 1; } print local(); }", "1.00\n");
    const auto result = run_source("{ fun local() { return 1; } } print local();");
    EXPECT_EQ(result.status, run_status::runtime_failure);
    EXPECT_EQ(result.err, "[line 1] Error at 'local': Undefined variable 'local'.\n");
}

TEST(runner, recursion)
{
    assert_output(R"(
fun fib(n) {
    if (n < 2) return n;
    return fib(n - 1) + fib(n - 2);
}
print fib(15);
)",
                  "610.00\n");
}

TEST(runner, breakEndsOnlyTheInnermostLoop)
{
    assert_output("for (var i = 0; i < 3; i = i + 1) { if (i == 1) break; print i; }", "0.00\n");
    assert_output(R"(
for (var i = 0; i < 2; i = i + 1) {
    var j = 0;
    while (true) {
        if (j == 2) break;
        print i * 10 + j;
        j = j + 1;
    }
}
)",
                  "0.00\n1.00\n10.00\n11.00\n");
}

TEST(runner, returnInsideLoopReturnsFromFunction)
{
    assert_output(R"(
fun first_over(limit) {
    var i = 0;
    while (true) {
        if (i > limit) return i;
        i = i + 1;
    }
}
print first_over(3);
print "after";
)",
                  "4.00\nafter\n");
    assert_output("fun nothing() { return; } print nothing();", "nil\n");
    assert_output("fun implicit() { 1; } print implicit();", "nil\n");
}

TEST(runner, runtimeErrorInsideLoopIsNotABreak)
{
    const auto result = run_source(R"(
var i = 0;
while (i < 3) {
    print i;
    i = i + nil;
}
print "unreachable";
)");
    EXPECT_EQ(result.status, run_status::runtime_failure);
    EXPECT_EQ(result.out, "0.00\n");
    EXPECT_EQ(result.err, "[line 5] Error at '+': Operands must be two numbers or two strings.\n");
}

TEST(runner, wrongArgumentCount)
{
    const auto result = run_source("fun add(a, b) { return a + b; }\nprint add(1);");
    EXPECT_EQ(result.status, run_status::runtime_failure);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err, "[line 2] Error at ')': Expected 2 arguments but got 1.\n");
}

TEST(runner, argumentsAreEvaluatedBeforeTheArityCheck)
{
    const auto result = run_source(R"(
fun log(x) { print x; return x; }
fun one(a) { return a; }
one(log(1), log(2));
)");
    EXPECT_EQ(result.status, run_status::runtime_failure);
    EXPECT_EQ(result.out, "1.00\n2.00\n");
}

TEST(runner, uninitializedVariable)
{
    const auto result = run_source("var a;\nprint a;");
    EXPECT_EQ(result.status, run_status::runtime_failure);
    EXPECT_EQ(result.err, "[line 2] Error at 'a': Uninitialized variable 'a'.\n");
}

TEST(runner, parseErrorMeansNothingRuns)
{
    const auto result = run_source("print 1;\nprint ;\nprint 2;\nvar = 3;");
    EXPECT_EQ(result.status, run_status::static_error);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err,
              "[line 2] Error at ';': Expect expression.\n"
              "[line 4] Error at '=': Expect variable name.\n");
}

TEST(runner, lexicalErrorMeansNothingRuns)
{
    const auto result = run_source("print 1;\nprint @;\nprint \"open");
    EXPECT_EQ(result.status, run_status::static_error);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err,
              "[line 2] Error: Unexpected character.\n"
              "[line 3] Error: Unterminated string.\n");
}

TEST(runner, hugeNumberLiteralIsInfinite)
{
    assert_output("print 1 + " + std::string(340, '9') + ";", "inf\n");
}

TEST(runner, readInputReadsLines)
{
    const auto result = run_source(R"(print read_input(); print read_input() + "!"; print read_input() == "";)",
                                   "first\nsecond");
    EXPECT_EQ(result.status, run_status::success) << result.err;
    EXPECT_EQ(result.out, "first\n\nsecond!\ntrue\n");
}

TEST(runner, sessionKeepsStateAcrossRuns)
{
    auto out = std::ostringstream {};
    auto err = std::ostringstream {};
    auto in = std::istringstream {};
    auto session = runner {out, err, in};
    {
        auto line = std::string {"var count = 0; fun bump() { count = count + 1; return count; }"};
        EXPECT_EQ(session.run(line), run_status::success);
    }
    EXPECT_EQ(session.run("bump(); bump();"), run_status::success);
    EXPECT_EQ(session.run("print bump();"), run_status::success);
    EXPECT_EQ(session.run("print undefined;"), run_status::runtime_failure);
    EXPECT_EQ(session.run("print count;"), run_status::success);
    EXPECT_EQ(out.str(), "3.00\n3.00\n");
    EXPECT_EQ(err.str(), "[line 1] Error at 'undefined': Undefined variable 'undefined'.\n");
}

TEST(runner, debugDumpsTheSyntaxTree)
{
    auto out = std::ostringstream {};
    auto err = std::ostringstream {};
    auto in = std::istringstream {};
    auto session = runner {out, err, in, true};
    EXPECT_EQ(session.run("var a = 1 + 2 * 3;\nprint a;"), run_status::success);
    const auto dump = err.str();
    EXPECT_EQ(dump.rfind("var a = (1 + (2 * 3));\nprint a;\n", 0), 0U) << dump;
    EXPECT_NE(dump.find("[a] = 7.00\n"), std::string::npos) << dump;
    EXPECT_NE(dump.find("[clock] = <fn clock>\n"), std::string::npos) << dump;
    EXPECT_EQ(out.str(), "7.00\n");
}
// NOLINTEND(*-magic-numbers)
