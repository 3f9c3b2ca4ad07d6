#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <ast/statement.hpp>
#include <eval/environment.hpp>
#include <eval/signal.hpp>
#include <lexer/token.hpp>

#include "literal.hpp"

struct evaluator;

struct user_function
{
    std::string name;
    std::vector<token> parameters;
    std::shared_ptr<const statement_list> body;
    environment_ptr closure;
};

// host failures are thrown as std::runtime_error
using native_body = std::function<literal(const std::vector<literal>&)>;

struct native_function
{
    std::string name;
    std::size_t arity {};
    native_body body;
};

struct callable final
{
    [[nodiscard]] auto name() const -> std::string_view;
    [[nodiscard]] auto arity() const -> std::size_t;
    auto call(evaluator& eval, std::vector<literal>&& arguments, const token& paren) const -> eval_result;

    std::variant<user_function, native_function> impl;
};
