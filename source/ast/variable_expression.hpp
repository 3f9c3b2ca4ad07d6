#pragma once

#include <string>
#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

struct variable_expression final : expression
{
    explicit variable_expression(token identifier)
        : name {std::move(identifier)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name;
};
