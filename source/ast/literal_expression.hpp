#pragma once

#include <string>
#include <utility>

#include <object/literal.hpp>

#include "expression.hpp"

struct literal_expression final : expression
{
    explicit literal_expression(literal val)
        : value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    literal value;
};
