#pragma once

#include <string>
#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

struct unary_expression final : expression
{
    unary_expression(token oprtr, expression_ptr operand)
        : op {std::move(oprtr)}
        , right {std::move(operand)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token op;
    expression_ptr right;
};
