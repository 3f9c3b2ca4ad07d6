#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <ast/binary_expression.hpp>
#include <ast/call_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/statements.hpp>
#include <ast/variable_expression.hpp>
#include <diagnostic.hpp>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <parser/parser.hpp>

#include "testutils.hpp"

namespace
{
auto assert_expression_statement(const program_ptr& prgrm) -> const expression_statement*
{
    EXPECT_EQ(prgrm->statements.size(), 1U);
    const auto* expr_stmt = dynamic_cast<const expression_statement*>(prgrm->statements.at(0).get());
    EXPECT_NE(expr_stmt, nullptr) << "expected expression_statement, got " << prgrm->statements.at(0)->string();
    return expr_stmt;
}
}  // namespace

// NOLINTBEGIN(*-magic-numbers)
TEST(parsing, operatorPrecedence)
{
    struct precedence_test
    {
        std::string_view input;
        std::string_view expected;
    };
    const precedence_test tests[] {
        {"1 + 2 * 3;", "(1 + (2 * 3));"},
        {"(1 + 2) * 3;", "((group (1 + 2)) * 3);"},
        {"-a * b;", "((-a) * b);"},
        {"!-a;", "(!(-a));"},
        {"!true == false;", "((!true) == false);"},
        {"a + b - c;", "((a + b) - c);"},
        {"a / b * c;", "((a / b) * c);"},
        {"1 < 2 == 3 >= 4;", "((1 < 2) == (3 >= 4));"},
        {"a or b and c;", "(a or (b and c));"},
        {"a and b or c and d;", "((a and b) or (c and d));"},
        {"a = b = c;", "(a = (b = c));"},
        {"a ? b : c ? d : e;", "(a ? b : (c ? d : e));"},
        {"a or b ? 1 : 2;", "((a or b) ? 1 : 2);"},
        {"1, 2, 3;", "((1 , 2) , 3);"},
        {"a = 1, b = 2;", "((a = 1) , (b = 2));"},
        {"f(1, 2)(3);", "f(1, 2)(3);"},
        {"-f(x) + 2.5;", "((-f(x)) + 2.5);"},
        {R"("hi" + nil;)", R"(("hi" + nil);)"},
    };
    for (const auto& [input, expected] : tests) {
        const auto prgrm = assert_program(input);
        EXPECT_EQ(prgrm->string(), expected) << "while parsing: " << input;
    }
}

TEST(parsing, binaryExpressionNodes)
{
    const auto prgrm = assert_program("x * 3;");
    const auto* expr_stmt = assert_expression_statement(prgrm);
    ASSERT_NE(expr_stmt, nullptr);
    const auto* binary = dynamic_cast<const binary_expression*>(expr_stmt->expr.get());
    ASSERT_NE(binary, nullptr);
    EXPECT_EQ(binary->op.type, token_type::asterisk);
    const auto* variable = dynamic_cast<const variable_expression*>(binary->left.get());
    ASSERT_NE(variable, nullptr);
    EXPECT_EQ(variable->name.lexeme, "x");
    const auto* lit = dynamic_cast<const literal_expression*>(binary->right.get());
    ASSERT_NE(lit, nullptr);
    EXPECT_DOUBLE_EQ(lit->value.as<number_value>(), 3);
}

TEST(parsing, callArgumentsAreAssignments)
{
    const auto prgrm = assert_program("f(a = 1, b);");
    const auto* expr_stmt = assert_expression_statement(prgrm);
    ASSERT_NE(expr_stmt, nullptr);
    const auto* call = dynamic_cast<const call_expression*>(expr_stmt->expr.get());
    ASSERT_NE(call, nullptr);
    ASSERT_EQ(call->arguments.size(), 2U);
    EXPECT_EQ(call->arguments[0]->string(), "(a = 1)");
    EXPECT_EQ(call->paren.type, token_type::rparen);
}

TEST(parsing, statements)
{
    struct statement_test
    {
        std::string_view input;
        std::string_view expected;
    };
    const statement_test tests[] {
        {"var x;", "var x;"},
        {"var x = 1 + 2;", "var x = (1 + 2);"},
        {"print x;", "print x;"},
        {"{ var a = 1; print a; }", "{ var a = 1; print a; }"},
        {"if (a) print 1; else print 2;", "if a print 1; else print 2;"},
        {"if (a) if (b) print 1; else print 2;", "if a if b print 1; else print 2;"},
        {"while (a < 3) a = a + 1;", "while (a < 3) (a = (a + 1));"},
        {"fun add(a, b) { return a + b; }", "fun add(a, b) { return (a + b); }"},
        {"fun f() { return; }", "fun f() { return; }"},
        {"while (true) break;", "while true break;"},
    };
    for (const auto& [input, expected] : tests) {
        const auto prgrm = assert_program(input);
        EXPECT_EQ(prgrm->string(), expected) << "while parsing: " << input;
    }
}

TEST(parsing, forLoopDesugarsIntoWhile)
{
    struct for_test
    {
        std::string_view input;
        std::string_view expected;
    };
    const for_test tests[] {
        {"for (var i = 0; i < 3; i = i + 1) print i;", "{ var i = 0; while (i < 3) { print i; (i = (i + 1)); } }"},
        {"for (i = 0; i < 3;) print i;", "{ (i = 0); while (i < 3) print i; }"},
        {"for (;;) break;", "while true break;"},
    };
    for (const auto& [input, expected] : tests) {
        const auto prgrm = assert_program(input);
        EXPECT_EQ(prgrm->string(), expected) << "while parsing: " << input;
    }
}

TEST(parsing, functionBodyIsShared)
{
    const auto prgrm = assert_program("fun f(a) { print a; }");
    ASSERT_EQ(prgrm->statements.size(), 1U);
    const auto* function = dynamic_cast<const function_statement*>(prgrm->statements[0].get());
    ASSERT_NE(function, nullptr);
    EXPECT_EQ(function->name.lexeme, "f");
    ASSERT_EQ(function->parameters.size(), 1U);
    EXPECT_EQ(function->parameters[0].lexeme, "a");
    const auto body = function->body;
    ASSERT_TRUE(body);
    EXPECT_EQ(body->size(), 1U);
    EXPECT_EQ(body.use_count(), 2);
}

TEST(parsing, parseErrors)
{
    struct error_test
    {
        std::string_view input;
        std::vector<std::string> expected;
    };
    const error_test tests[] {
        {"var = 1;", {"[line 1] Error at '=': Expect variable name."}},
        {"print 1", {"[line 1] Error at end: Expect ';' after value."}},
        {"print (1;", {"[line 1] Error at ';': Expect ')' after expression."}},
        {"a + 1 = 2;", {"[line 1] Error at '=': Invalid assignment target."}},
        {"break;", {"[line 1] Error at 'break': Must be inside a loop to use 'break'."}},
        {"return 1;", {"[line 1] Error at 'return': Can't return from top-level code."}},
        {"* 3;", {"[line 1] Error at '*': Missing left-hand operand."}},
        {"== 3;", {"[line 1] Error at '==': Missing left-hand operand."}},
        {"<= 1 + 2;", {"[line 1] Error at '<=': Missing left-hand operand."}},
        {"+ 3;", {"[line 1] Error at '+': Missing left-hand operand."}},
        {"1 +;", {"[line 1] Error at ';': Expect expression."}},
        {"a ? b;", {"[line 1] Error at ';': Expect ':' after then branch of ternary expression."}},
        {"fun (a) {}", {"[line 1] Error at '(': Expect function name."}},
        {"{ print 1;", {"[line 1] Error at end: Expect '}' after block."}},
        {"var a = 1;\nvar b = ;\nvar = 3;",
         {"[line 2] Error at ';': Expect expression.", "[line 3] Error at '=': Expect variable name."}},
    };
    for (const auto& [input, expected] : tests) {
        EXPECT_EQ(parse_errors(input), expected) << "while parsing: " << input;
    }
}

TEST(parsing, breakDepthFollowsLexicalNesting)
{
    EXPECT_TRUE(parse_errors("while (true) { if (true) break; }").empty());
    EXPECT_TRUE(parse_errors("for (;;) { while (false) {} break; }").empty());
    EXPECT_EQ(parse_errors("while (true) {} break;"),
              (std::vector<std::string> {"[line 1] Error at 'break': Must be inside a loop to use 'break'."}));
    EXPECT_EQ(parse_errors("while (true) { fun f() { break; } }"),
              (std::vector<std::string> {"[line 1] Error at 'break': Must be inside a loop to use 'break'."}));
    EXPECT_EQ(parse_errors("while (true) { var = 1; } break;"),
              (std::vector<std::string> {"[line 1] Error at '=': Expect variable name.",
                                         "[line 1] Error at 'break': Must be inside a loop to use 'break'."}));
}

TEST(parsing, returnInsideFunctionIsAllowed)
{
    EXPECT_TRUE(parse_errors("fun f() { while (true) { return 1; } }").empty());
    EXPECT_EQ(parse_errors("fun f() {} return;"),
              (std::vector<std::string> {"[line 1] Error at 'return': Can't return from top-level code."}));
}

TEST(parsing, tooManyArguments)
{
    auto args = std::string {"0"};
    for (auto idx = 0; idx < 255; ++idx) {
        args += ", 0";
    }
    EXPECT_EQ(parse_errors(fmt::format("f({});", args)),
              (std::vector<std::string> {"[line 1] Error at '0': Can't have more than 255 arguments."}));

    auto params = std::string {"p0"};
    for (auto idx = 1; idx < 256; ++idx) {
        params += fmt::format(", p{}", idx);
    }
    EXPECT_EQ(parse_errors(fmt::format("fun f({}) {{}}", params)),
              (std::vector<std::string> {"[line 1] Error at 'p255': Can't have more than 255 parameters."}));
}

TEST(parsing, parseReportsOneResultPerDeclaration)
{
    auto prsr = parser {scan("print 1; var = 2; print 3;")};
    const auto results = prsr.parse();
    ASSERT_EQ(results.size(), 3U);
    ASSERT_TRUE(std::holds_alternative<statement_ptr>(results[0]));
    EXPECT_EQ(std::get<statement_ptr>(results[0])->string(), "print 1;");
    ASSERT_TRUE(std::holds_alternative<diagnostic>(results[1]));
    EXPECT_EQ(std::get<diagnostic>(results[1]).message, "Expect variable name.");
    ASSERT_TRUE(std::holds_alternative<statement_ptr>(results[2]));
    EXPECT_EQ(std::get<statement_ptr>(results[2])->string(), "print 3;");
    EXPECT_EQ(prsr.errors().size(), 1U);
}

TEST(parsing, errorInsideBlockFailsTheEnclosingDeclaration)
{
    auto prsr = parser {scan("{ var = 1; print 2; } print 3;")};
    const auto results = prsr.parse();
    ASSERT_EQ(results.size(), 2U);
    EXPECT_TRUE(std::holds_alternative<diagnostic>(results[0]));
    EXPECT_TRUE(std::holds_alternative<statement_ptr>(results[1]));
}
// NOLINTEND(*-magic-numbers)
