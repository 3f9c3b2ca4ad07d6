#pragma once

#include <string>
#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

struct assign_expression final : expression
{
    assign_expression(token identifier, expression_ptr val)
        : name {std::move(identifier)}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name;
    expression_ptr value;
};
