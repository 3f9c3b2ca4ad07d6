#include <algorithm>
#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "evaluator.hpp"

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/call_expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/logical_expression.hpp>
#include <ast/statements.hpp>
#include <ast/ternary_expression.hpp>
#include <ast/unary_expression.hpp>
#include <ast/variable_expression.hpp>
#include <builtin/builtin.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lexer/token_type.hpp>
#include <object/callable.hpp>
#include <object/literal.hpp>
#include <scoped_value.hpp>

#include "environment.hpp"
#include "signal.hpp"

namespace
{
constexpr std::size_t min_prune_at = 64;
}  // namespace

evaluator::evaluator(environment_ptr globals, std::ostream& out, std::istream& in)
    : m_globals {std::move(globals)}
    , m_env {m_globals}
    , m_prune_at {min_prune_at}
    , m_out {out}
{
    define_builtins(*m_globals, in);
}

auto evaluator::interpret(const statement_list& stmts) -> std::optional<runtime_error>
{
    for (const auto& stmt : stmts) {
        stmt->accept(*this);
        if (m_signal) {
            auto done = std::exchange(m_signal, std::nullopt);
            if (auto* err = std::get_if<runtime_error>(&*done); err != nullptr) {
                return std::move(*err);
            }
        }
    }
    return std::nullopt;
}

auto evaluator::execute_block(const statement_list& stmts, environment_ptr scope) -> completion
{
    {
        const scoped_value<environment_ptr> enter {m_env, std::move(scope)};
        for (const auto& stmt : stmts) {
            stmt->accept(*this);
            if (m_signal) {
                break;
            }
        }
    }
    return std::exchange(m_signal, std::nullopt);
}

auto evaluator::make_scope(environment_ptr parent) -> environment_ptr
{
    if (m_scopes.size() >= m_prune_at) {
        std::erase_if(m_scopes, [](const auto& scope) { return scope.expired(); });
        m_prune_at = std::max(min_prune_at, m_scopes.size() * 2);
    }
    auto scope = std::make_shared<environment>(std::move(parent));
    m_scopes.emplace_back(scope);
    return scope;
}

auto evaluator::release_scopes() -> void
{
    auto scopes = std::exchange(m_scopes, {});
    for (const auto& weak : scopes) {
        if (const auto scope = weak.lock(); scope) {
            scope->break_cycle();
        }
    }
    m_globals->break_cycle();
}

auto evaluator::evaluate(const expression& expr) -> eval_result
{
    expr.accept(*this);
    if (m_signal) {
        return *std::exchange(m_signal, std::nullopt);
    }
    return m_result;
}

auto evaluator::globals() const -> const environment_ptr&
{
    return m_globals;
}

void evaluator::fail(const token& where, std::string message)
{
    m_signal = runtime_error {.where = where, .message = std::move(message)};
}

void evaluator::visit(const assign_expression& expr)
{
    expr.value->accept(*this);
    if (m_signal) {
        return;
    }
    if (!m_env->assign(expr.name.lexeme, m_result)) {
        fail(expr.name, fmt::format("Undefined variable '{}'.", expr.name.lexeme));
    }
}

namespace
{
auto both_numbers(const literal& left, const literal& right) -> bool
{
    return left.is<number_value>() && right.is<number_value>();
}

auto add(const literal& left, const literal& right) -> std::optional<literal>
{
    if (both_numbers(left, right)) {
        return literal {left.as<number_value>() + right.as<number_value>()};
    }
    if (left.is<string_value>() && right.is<string_value>()) {
        return literal {left.as<string_value>() + right.as<string_value>()};
    }
    if (left.is<string_value>() && right.is<number_value>()) {
        return literal {left.as<string_value>() + number_to_string(right.as<number_value>())};
    }
    if (left.is<number_value>() && right.is<string_value>()) {
        return literal {number_to_string(left.as<number_value>()) + right.as<string_value>()};
    }
    return std::nullopt;
}

auto apply_arithmetic(token_type oper, number_value left, number_value right) -> literal
{
    using enum token_type;
    switch (oper) {
        case minus:
            return literal {left - right};
        case asterisk:
            return literal {left * right};
        case slash:
            return literal {left / right};
        case greater_than:
            return literal {left > right};
        case greater_equal:
            return literal {left >= right};
        case less_than:
            return literal {left < right};
        case less_equal:
            return literal {left <= right};
        default:
            return literal {};
    }
}
}  // namespace

void evaluator::visit(const binary_expression& expr)
{
    expr.left->accept(*this);
    if (m_signal) {
        return;
    }
    const auto left = std::move(m_result);
    expr.right->accept(*this);
    if (m_signal) {
        return;
    }
    const auto& right = m_result;

    using enum token_type;
    switch (expr.op.type) {
        case comma:
            return;
        case equals:
            m_result = literal {is_equal(left, right)};
            return;
        case not_equals:
            m_result = literal {!is_equal(left, right)};
            return;
        case plus:
            if (auto sum = add(left, right); sum.has_value()) {
                m_result = std::move(*sum);
                return;
            }
            fail(expr.op, "Operands must be two numbers or two strings.");
            return;
        default:
            break;
    }
    if (!both_numbers(left, right)) {
        fail(expr.op, "Operands must be numbers.");
        return;
    }
    m_result = apply_arithmetic(expr.op.type, left.as<number_value>(), right.as<number_value>());
}

void evaluator::visit(const call_expression& expr)
{
    expr.callee->accept(*this);
    if (m_signal) {
        return;
    }
    const auto callee = std::move(m_result);

    auto arguments = std::vector<literal>();
    arguments.reserve(expr.arguments.size());
    for (const auto& argument : expr.arguments) {
        argument->accept(*this);
        if (m_signal) {
            return;
        }
        arguments.push_back(std::move(m_result));
    }

    if (!callee.is<callable_ptr>()) {
        fail(expr.paren, "Can only call functions and classes.");
        return;
    }
    const auto function = callee.as<callable_ptr>();
    if (arguments.size() != function->arity()) {
        fail(expr.paren, fmt::format("Expected {} arguments but got {}.", function->arity(), arguments.size()));
        return;
    }
    auto result = function->call(*this, std::move(arguments), expr.paren);
    if (auto* val = std::get_if<literal>(&result); val != nullptr) {
        m_result = std::move(*val);
        return;
    }
    m_signal = std::move(std::get<control_signal>(result));
}

void evaluator::visit(const grouping_expression& expr)
{
    expr.inner->accept(*this);
}

void evaluator::visit(const literal_expression& expr)
{
    m_result = expr.value;
}

void evaluator::visit(const logical_expression& expr)
{
    expr.left->accept(*this);
    if (m_signal) {
        return;
    }
    const auto left_truthy = is_truthy(m_result);
    if (expr.op.type == token_type::logical_or ? left_truthy : !left_truthy) {
        return;
    }
    expr.right->accept(*this);
}

void evaluator::visit(const ternary_expression& expr)
{
    expr.condition->accept(*this);
    if (m_signal) {
        return;
    }
    if (is_truthy(m_result)) {
        expr.consequence->accept(*this);
    } else {
        expr.alternative->accept(*this);
    }
}

void evaluator::visit(const unary_expression& expr)
{
    expr.right->accept(*this);
    if (m_signal) {
        return;
    }
    using enum token_type;
    switch (expr.op.type) {
        case exclamation:
            m_result = literal {!is_truthy(m_result)};
            return;
        case minus:
            if (!m_result.is<number_value>()) {
                fail(expr.op, "Operand must be a number.");
                return;
            }
            m_result = literal {-m_result.as<number_value>()};
            return;
        default:
            return;
    }
}

void evaluator::visit(const variable_expression& expr)
{
    const auto* val = m_env->get(expr.name.lexeme);
    if (val == nullptr) {
        fail(expr.name, fmt::format("Undefined variable '{}'.", expr.name.lexeme));
        return;
    }
    if (!val->has_value()) {
        fail(expr.name, fmt::format("Uninitialized variable '{}'.", expr.name.lexeme));
        return;
    }
    m_result = **val;
}

void evaluator::visit(const block_statement& stmt)
{
    m_signal = execute_block(stmt.statements, make_scope(m_env));
}

void evaluator::visit(const break_statement& /*stmt*/)
{
    m_signal = break_signal {};
}

void evaluator::visit(const expression_statement& stmt)
{
    stmt.expr->accept(*this);
}

void evaluator::visit(const function_statement& stmt)
{
    auto function = std::make_shared<const callable>(callable {
        .impl =
            user_function {
                .name = stmt.name.lexeme,
                .parameters = stmt.parameters,
                .body = stmt.body,
                .closure = m_env,
            },
    });
    m_env->define(stmt.name.lexeme, literal {std::move(function)});
}

void evaluator::visit(const if_statement& stmt)
{
    stmt.condition->accept(*this);
    if (m_signal) {
        return;
    }
    if (is_truthy(m_result)) {
        stmt.consequence->accept(*this);
    } else if (stmt.alternative) {
        stmt.alternative->accept(*this);
    }
}

void evaluator::visit(const print_statement& stmt)
{
    stmt.expr->accept(*this);
    if (m_signal) {
        return;
    }
    fmt::print(m_out, "{}\n", m_result.inspect());
}

void evaluator::visit(const return_statement& stmt)
{
    auto value = literal {};
    if (stmt.value) {
        stmt.value->accept(*this);
        if (m_signal) {
            return;
        }
        value = std::move(m_result);
    }
    m_signal = return_signal {.value = std::move(value)};
}

void evaluator::visit(const var_statement& stmt)
{
    if (!stmt.initializer) {
        m_env->define(stmt.name.lexeme, std::nullopt);
        return;
    }
    stmt.initializer->accept(*this);
    if (m_signal) {
        return;
    }
    m_env->define(stmt.name.lexeme, m_result);
}

void evaluator::visit(const while_statement& stmt)
{
    while (true) {
        stmt.condition->accept(*this);
        if (m_signal || !is_truthy(m_result)) {
            return;
        }
        stmt.body->accept(*this);
        if (m_signal) {
            if (std::holds_alternative<break_signal>(*m_signal)) {
                m_signal.reset();
            }
            return;
        }
    }
}
