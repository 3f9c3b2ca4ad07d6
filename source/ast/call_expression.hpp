#pragma once

#include <string>
#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

struct call_expression final : expression
{
    call_expression(expression_ptr function, token closing_paren, expressions args)
        : callee {std::move(function)}
        , paren {std::move(closing_paren)}
        , arguments {std::move(args)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr callee;
    // the closing parenthesis, runtime errors of the call are reported at it
    token paren;
    expressions arguments;
};
