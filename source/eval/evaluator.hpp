#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <ast/expression.hpp>
#include <ast/statement.hpp>
#include <ast/visitor.hpp>
#include <lexer/token.hpp>
#include <object/literal.hpp>

#include "environment.hpp"
#include "signal.hpp"

struct evaluator final : visitor
{
    evaluator(environment_ptr globals, std::ostream& out, std::istream& in);

    // runs statements against the globals, stopping at the first runtime error
    auto interpret(const statement_list& stmts) -> std::optional<runtime_error>;
    auto execute_block(const statement_list& stmts, environment_ptr scope) -> completion;
    auto evaluate(const expression& expr) -> eval_result;

    [[nodiscard]] auto globals() const -> const environment_ptr&;

    // new scope enclosed by parent, tracked until release_scopes
    auto make_scope(environment_ptr parent) -> environment_ptr;
    // breaks the closure cycles of every scope still alive, the globals included
    auto release_scopes() -> void;

  protected:
    void visit(const assign_expression& expr) final;
    void visit(const binary_expression& expr) final;
    void visit(const call_expression& expr) final;
    void visit(const grouping_expression& expr) final;
    void visit(const literal_expression& expr) final;
    void visit(const logical_expression& expr) final;
    void visit(const ternary_expression& expr) final;
    void visit(const unary_expression& expr) final;
    void visit(const variable_expression& expr) final;

    void visit(const block_statement& stmt) final;
    void visit(const break_statement& stmt) final;
    void visit(const expression_statement& stmt) final;
    void visit(const function_statement& stmt) final;
    void visit(const if_statement& stmt) final;
    void visit(const print_statement& stmt) final;
    void visit(const return_statement& stmt) final;
    void visit(const var_statement& stmt) final;
    void visit(const while_statement& stmt) final;

  private:
    void fail(const token& where, std::string message);

    literal m_result;
    completion m_signal;
    environment_ptr m_globals;
    environment_ptr m_env;
    std::vector<std::weak_ptr<environment>> m_scopes;
    std::size_t m_prune_at;
    std::ostream& m_out;
};
