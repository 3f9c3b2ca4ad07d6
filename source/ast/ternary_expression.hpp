#pragma once

#include <string>
#include <utility>

#include "expression.hpp"

struct ternary_expression final : expression
{
    ternary_expression(expression_ptr cond, expression_ptr then, expression_ptr otherwise)
        : condition {std::move(cond)}
        , consequence {std::move(then)}
        , alternative {std::move(otherwise)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    expression_ptr consequence;
    expression_ptr alternative;
};
