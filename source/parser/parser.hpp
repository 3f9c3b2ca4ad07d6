#pragma once

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statement.hpp>
#include <diagnostic.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

// unwinds a declaration that failed to parse
class parse_error final : public std::runtime_error
{
  public:
    explicit parse_error(diagnostic diag);

    [[nodiscard]] auto diag() const -> const diagnostic&;

  private:
    diagnostic m_diag;
};

// one per top-level declaration
using parse_result = std::variant<statement_ptr, diagnostic>;

class parser final
{
  public:
    explicit parser(std::vector<token> tokens);

    auto parse() -> std::vector<parse_result>;
    auto parse_program() -> program_ptr;
    [[nodiscard]] auto errors() const -> const std::vector<diagnostic>&;

  private:
    using level_parser = expression_ptr (parser::*)();

    auto parse_declaration() -> statement_ptr;
    auto parse_function_declaration() -> statement_ptr;
    auto parse_var_declaration() -> statement_ptr;
    auto parse_statement() -> statement_ptr;
    auto parse_print_statement() -> statement_ptr;
    auto parse_expression_statement() -> statement_ptr;
    auto parse_block() -> statement_list;
    auto parse_if_statement() -> statement_ptr;
    auto parse_while_statement() -> statement_ptr;
    auto parse_for_statement() -> statement_ptr;
    auto parse_break_statement() -> statement_ptr;
    auto parse_return_statement() -> statement_ptr;

    auto parse_expression() -> expression_ptr;
    auto parse_comma() -> expression_ptr;
    auto parse_assignment() -> expression_ptr;
    auto parse_ternary() -> expression_ptr;
    auto parse_logic_or() -> expression_ptr;
    auto parse_logic_and() -> expression_ptr;
    auto parse_equality() -> expression_ptr;
    auto parse_comparison() -> expression_ptr;
    auto parse_term() -> expression_ptr;
    auto parse_factor() -> expression_ptr;
    auto parse_unary() -> expression_ptr;
    auto parse_call() -> expression_ptr;
    auto finish_call(expression_ptr callee) -> expression_ptr;
    auto parse_primary() -> expression_ptr;

    auto parse_binary(std::initializer_list<token_type> operators, level_parser operand) -> expression_ptr;
    auto parse_logical(token_type oprtr, level_parser operand) -> expression_ptr;
    [[noreturn]] auto missing_left_operand(level_parser operand) -> void;

    auto get(std::initializer_list<token_type> types) -> bool;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    auto expect(token_type type, const std::string& message) -> const token&;
    auto next_token() -> const token&;
    [[nodiscard]] auto current_token() const -> const token&;
    [[nodiscard]] auto previous_token() const -> const token&;
    [[nodiscard]] auto at_end() const -> bool;
    auto synchronize() -> void;

    [[nodiscard]] static auto error(const token& where, const std::string& message) -> parse_error;
    auto report(const token& where, const std::string& message) -> void;

    std::vector<token> m_tokens;
    std::size_t m_current {0};
    std::size_t m_loop_depth {0};
    std::size_t m_function_depth {0};
    std::vector<diagnostic> m_errors;
};
