#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "parser.hpp"

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/call_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/logical_expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/ternary_expression.hpp>
#include <ast/unary_expression.hpp>
#include <ast/variable_expression.hpp>
#include <diagnostic.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <object/literal.hpp>
#include <scoped_value.hpp>

namespace
{
constexpr std::size_t max_arguments = 255;
}  // namespace

parse_error::parse_error(diagnostic diag)
    : std::runtime_error {diag.message}
    , m_diag {std::move(diag)}
{
}

auto parse_error::diag() const -> const diagnostic&
{
    return m_diag;
}

parser::parser(std::vector<token> tokens)
    : m_tokens {std::move(tokens)}
{
    if (m_tokens.empty() || m_tokens.back().type != token_type::eof) {
        const auto line = m_tokens.empty() ? std::size_t {1} : m_tokens.back().line;
        m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .value = {}, .line = line});
    }
}

auto parser::parse() -> std::vector<parse_result>
{
    auto results = std::vector<parse_result>();
    while (!at_end()) {
        const auto errors_before = m_errors.size();
        auto stmt = parse_declaration();
        if (m_errors.size() > errors_before) {
            results.emplace_back(m_errors[errors_before]);
        } else {
            results.emplace_back(std::move(stmt));
        }
    }
    return results;
}

auto parser::parse_program() -> program_ptr
{
    auto prgrm = std::make_unique<program>();
    for (auto& result : parse()) {
        if (auto* stmt = std::get_if<statement_ptr>(&result); stmt != nullptr) {
            prgrm->statements.push_back(std::move(*stmt));
        }
    }
    return prgrm;
}

auto parser::errors() const -> const std::vector<diagnostic>&
{
    return m_errors;
}

auto parser::parse_declaration() -> statement_ptr
{
    using enum token_type;
    try {
        if (get({fun})) {
            return parse_function_declaration();
        }
        if (get({var})) {
            return parse_var_declaration();
        }
        return parse_statement();
    } catch (const parse_error& err) {
        m_errors.push_back(err.diag());
        synchronize();
        return nullptr;
    }
}

auto parser::parse_function_declaration() -> statement_ptr
{
    using enum token_type;
    auto name = expect(ident, "Expect function name.");
    expect(lparen, "Expect '(' after function name.");
    auto parameters = std::vector<token>();
    if (!current_token_is(rparen)) {
        do {
            if (parameters.size() >= max_arguments) {
                report(current_token(), "Can't have more than 255 parameters.");
            }
            parameters.push_back(expect(ident, "Expect parameter name."));
        } while (get({comma}));
    }
    expect(rparen, "Expect ')' after parameters.");
    expect(lsquirly, "Expect '{' before function body.");

    const scoped_value<std::size_t> in_function {m_function_depth, m_function_depth + 1};
    const scoped_value<std::size_t> outside_loops {m_loop_depth, 0};
    auto body = std::make_shared<const statement_list>(parse_block());
    return std::make_unique<function_statement>(std::move(name), std::move(parameters), std::move(body));
}

auto parser::parse_var_declaration() -> statement_ptr
{
    using enum token_type;
    auto name = expect(ident, "Expect variable name.");
    auto initializer = expression_ptr {};
    if (get({assign})) {
        initializer = parse_expression();
    }
    expect(semicolon, "Expect ';' after variable declaration.");
    return std::make_unique<var_statement>(std::move(name), std::move(initializer));
}

auto parser::parse_statement() -> statement_ptr
{
    using enum token_type;
    if (get({print})) {
        return parse_print_statement();
    }
    if (get({lsquirly})) {
        return std::make_unique<block_statement>(parse_block());
    }
    if (get({eef})) {
        return parse_if_statement();
    }
    if (get({hwile})) {
        return parse_while_statement();
    }
    if (get({fore})) {
        return parse_for_statement();
    }
    if (get({brake})) {
        return parse_break_statement();
    }
    if (get({ret})) {
        return parse_return_statement();
    }
    return parse_expression_statement();
}

auto parser::parse_print_statement() -> statement_ptr
{
    auto value = parse_expression();
    expect(token_type::semicolon, "Expect ';' after value.");
    return std::make_unique<print_statement>(std::move(value));
}

auto parser::parse_expression_statement() -> statement_ptr
{
    auto expr = parse_expression();
    expect(token_type::semicolon, "Expect ';' after expression.");
    return std::make_unique<expression_statement>(std::move(expr));
}

auto parser::parse_block() -> statement_list
{
    auto stmts = statement_list();
    while (!current_token_is(token_type::rsquirly) && !at_end()) {
        if (auto decl = parse_declaration(); decl) {
            stmts.push_back(std::move(decl));
        }
    }
    expect(token_type::rsquirly, "Expect '}' after block.");
    return stmts;
}

auto parser::parse_if_statement() -> statement_ptr
{
    using enum token_type;
    expect(lparen, "Expect '(' after 'if'.");
    auto condition = parse_expression();
    expect(rparen, "Expect ')' after if condition.");
    auto consequence = parse_statement();
    auto alternative = statement_ptr {};
    if (get({elze})) {
        alternative = parse_statement();
    }
    return std::make_unique<if_statement>(std::move(condition), std::move(consequence), std::move(alternative));
}

auto parser::parse_while_statement() -> statement_ptr
{
    using enum token_type;
    expect(lparen, "Expect '(' after 'while'.");
    auto condition = parse_expression();
    expect(rparen, "Expect ')' after condition.");
    const scoped_value<std::size_t> in_loop {m_loop_depth, m_loop_depth + 1};
    auto body = parse_statement();
    return std::make_unique<while_statement>(std::move(condition), std::move(body));
}

// desugars into block[initializer, while(condition, block[body, increment])]
auto parser::parse_for_statement() -> statement_ptr
{
    using enum token_type;
    expect(lparen, "Expect '(' after 'for'.");

    auto initializer = statement_ptr {};
    if (get({var})) {
        initializer = parse_var_declaration();
    } else if (!get({semicolon})) {
        initializer = parse_expression_statement();
    }

    auto condition = expression_ptr {};
    if (!current_token_is(semicolon)) {
        condition = parse_expression();
    }
    expect(semicolon, "Expect ';' after loop condition.");

    auto increment = expression_ptr {};
    if (!current_token_is(rparen)) {
        increment = parse_expression();
    }
    expect(rparen, "Expect ')' after for clauses.");

    auto body = statement_ptr {};
    {
        const scoped_value<std::size_t> in_loop {m_loop_depth, m_loop_depth + 1};
        body = parse_statement();
    }

    if (increment) {
        auto stmts = statement_list();
        stmts.push_back(std::move(body));
        stmts.push_back(std::make_unique<expression_statement>(std::move(increment)));
        body = std::make_unique<block_statement>(std::move(stmts));
    }
    if (!condition) {
        condition = std::make_unique<literal_expression>(literal {true});
    }
    body = std::make_unique<while_statement>(std::move(condition), std::move(body));
    if (initializer) {
        auto stmts = statement_list();
        stmts.push_back(std::move(initializer));
        stmts.push_back(std::move(body));
        body = std::make_unique<block_statement>(std::move(stmts));
    }
    return body;
}

auto parser::parse_break_statement() -> statement_ptr
{
    auto keyword = previous_token();
    if (m_loop_depth == 0) {
        report(keyword, "Must be inside a loop to use 'break'.");
    }
    expect(token_type::semicolon, "Expect ';' after 'break'.");
    return std::make_unique<break_statement>(std::move(keyword));
}

auto parser::parse_return_statement() -> statement_ptr
{
    auto keyword = previous_token();
    if (m_function_depth == 0) {
        report(keyword, "Can't return from top-level code.");
    }
    auto value = expression_ptr {};
    if (!current_token_is(token_type::semicolon)) {
        value = parse_expression();
    }
    expect(token_type::semicolon, "Expect ';' after return value.");
    return std::make_unique<return_statement>(std::move(keyword), std::move(value));
}

auto parser::parse_expression() -> expression_ptr
{
    return parse_comma();
}

auto parser::parse_comma() -> expression_ptr
{
    return parse_binary({token_type::comma}, &parser::parse_assignment);
}

auto parser::parse_assignment() -> expression_ptr
{
    auto expr = parse_ternary();
    if (!get({token_type::assign})) {
        return expr;
    }
    const auto equals = previous_token();
    auto value = parse_assignment();
    if (const auto* variable = dynamic_cast<const variable_expression*>(expr.get()); variable != nullptr) {
        return std::make_unique<assign_expression>(variable->name, std::move(value));
    }
    report(equals, "Invalid assignment target.");
    return expr;
}

auto parser::parse_ternary() -> expression_ptr
{
    auto condition = parse_logic_or();
    if (!get({token_type::question})) {
        return condition;
    }
    auto consequence = parse_expression();
    expect(token_type::colon, "Expect ':' after then branch of ternary expression.");
    auto alternative = parse_ternary();
    return std::make_unique<ternary_expression>(std::move(condition), std::move(consequence), std::move(alternative));
}

auto parser::parse_logic_or() -> expression_ptr
{
    return parse_logical(token_type::logical_or, &parser::parse_logic_and);
}

auto parser::parse_logic_and() -> expression_ptr
{
    return parse_logical(token_type::logical_and, &parser::parse_equality);
}

auto parser::parse_equality() -> expression_ptr
{
    using enum token_type;
    return parse_binary({not_equals, equals}, &parser::parse_comparison);
}

auto parser::parse_comparison() -> expression_ptr
{
    using enum token_type;
    return parse_binary({greater_than, greater_equal, less_than, less_equal}, &parser::parse_term);
}

auto parser::parse_term() -> expression_ptr
{
    using enum token_type;
    return parse_binary({minus, plus}, &parser::parse_factor);
}

auto parser::parse_factor() -> expression_ptr
{
    using enum token_type;
    return parse_binary({slash, asterisk}, &parser::parse_unary);
}

auto parser::parse_unary() -> expression_ptr
{
    if (get({token_type::exclamation, token_type::minus})) {
        auto oprtr = previous_token();
        auto right = parse_unary();
        return std::make_unique<unary_expression>(std::move(oprtr), std::move(right));
    }
    return parse_call();
}

auto parser::parse_call() -> expression_ptr
{
    auto expr = parse_primary();
    while (get({token_type::lparen})) {
        expr = finish_call(std::move(expr));
    }
    return expr;
}

auto parser::finish_call(expression_ptr callee) -> expression_ptr
{
    auto arguments = expressions();
    if (!current_token_is(token_type::rparen)) {
        do {
            if (arguments.size() >= max_arguments) {
                report(current_token(), "Can't have more than 255 arguments.");
            }
            arguments.push_back(parse_assignment());
        } while (get({token_type::comma}));
    }
    auto paren = expect(token_type::rparen, "Expect ')' after arguments.");
    return std::make_unique<call_expression>(std::move(callee), std::move(paren), std::move(arguments));
}

auto parser::parse_primary() -> expression_ptr
{
    using enum token_type;
    if (get({fals})) {
        return std::make_unique<literal_expression>(literal {false});
    }
    if (get({tru})) {
        return std::make_unique<literal_expression>(literal {true});
    }
    if (get({nil})) {
        return std::make_unique<literal_expression>(literal {});
    }
    if (get({number, string})) {
        return std::make_unique<literal_expression>(previous_token().value.value_or(literal {}));
    }
    if (get({ident})) {
        return std::make_unique<variable_expression>(previous_token());
    }
    if (get({lparen})) {
        auto inner = parse_expression();
        expect(rparen, "Expect ')' after expression.");
        return std::make_unique<grouping_expression>(std::move(inner));
    }
    if (get({not_equals, equals})) {
        missing_left_operand(&parser::parse_equality);
    }
    if (get({greater_than, greater_equal, less_than, less_equal})) {
        missing_left_operand(&parser::parse_comparison);
    }
    if (get({plus})) {
        missing_left_operand(&parser::parse_term);
    }
    if (get({slash, asterisk})) {
        missing_left_operand(&parser::parse_factor);
    }
    throw error(current_token(), "Expect expression.");
}

auto parser::parse_binary(std::initializer_list<token_type> operators, level_parser operand) -> expression_ptr
{
    auto expr = (this->*operand)();
    while (get(operators)) {
        auto oprtr = previous_token();
        auto right = (this->*operand)();
        expr = std::make_unique<binary_expression>(std::move(expr), std::move(oprtr), std::move(right));
    }
    return expr;
}

auto parser::parse_logical(token_type oprtr, level_parser operand) -> expression_ptr
{
    auto expr = (this->*operand)();
    while (get({oprtr})) {
        auto op = previous_token();
        auto right = (this->*operand)();
        expr = std::make_unique<logical_expression>(std::move(expr), std::move(op), std::move(right));
    }
    return expr;
}

// the right-hand side is consumed so that parsing resumes after the whole malformed expression
auto parser::missing_left_operand(level_parser operand) -> void
{
    const auto oprtr = previous_token();
    try {
        static_cast<void>((this->*operand)());
    } catch (const parse_error&) {
        throw error(oprtr, "Missing left-hand operand.");
    }
    throw error(oprtr, "Missing left-hand operand.");
}

auto parser::get(std::initializer_list<token_type> types) -> bool
{
    for (const auto type : types) {
        if (current_token_is(type)) {
            next_token();
            return true;
        }
    }
    return false;
}

auto parser::current_token_is(token_type type) const -> bool
{
    return current_token().type == type;
}

auto parser::expect(token_type type, const std::string& message) -> const token&
{
    if (current_token_is(type)) {
        return next_token();
    }
    throw error(current_token(), message);
}

auto parser::next_token() -> const token&
{
    if (!at_end()) {
        m_current++;
    }
    return previous_token();
}

auto parser::current_token() const -> const token&
{
    return m_tokens[m_current];
}

auto parser::previous_token() const -> const token&
{
    return m_tokens[m_current - 1];
}

auto parser::at_end() const -> bool
{
    return current_token_is(token_type::eof);
}

auto parser::synchronize() -> void
{
    using enum token_type;
    next_token();
    while (!at_end()) {
        if (previous_token().type == semicolon) {
            return;
        }
        switch (current_token().type) {
            case klass:
            case fun:
            case var:
            case fore:
            case eef:
            case hwile:
            case print:
            case ret:
                return;
            default:
                next_token();
        }
    }
}

auto parser::error(const token& where, const std::string& message) -> parse_error
{
    return parse_error {diagnostic::at(where, message)};
}

auto parser::report(const token& where, const std::string& message) -> void
{
    m_errors.push_back(diagnostic::at(where, message));
}
