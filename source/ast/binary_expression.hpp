#pragma once

#include <string>
#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

struct binary_expression final : expression
{
    binary_expression(expression_ptr lhs, token oprtr, expression_ptr rhs)
        : left {std::move(lhs)}
        , op {std::move(oprtr)}
        , right {std::move(rhs)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left;
    token op;
    expression_ptr right;
};
