#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <lexer/token.hpp>

#include "expression.hpp"
#include "statement.hpp"

struct block_statement final : statement
{
    explicit block_statement(statement_list stmts)
        : statements {std::move(stmts)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    statement_list statements;
};

struct expression_statement final : statement
{
    explicit expression_statement(expression_ptr expression)
        : expr {std::move(expression)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};

struct print_statement final : statement
{
    explicit print_statement(expression_ptr expression)
        : expr {std::move(expression)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};

struct var_statement final : statement
{
    var_statement(token identifier, expression_ptr init)
        : name {std::move(identifier)}
        , initializer {std::move(init)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name;
    // null when declared without initializer
    expression_ptr initializer;
};

struct if_statement final : statement
{
    if_statement(expression_ptr cond, statement_ptr then, statement_ptr otherwise)
        : condition {std::move(cond)}
        , consequence {std::move(then)}
        , alternative {std::move(otherwise)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    statement_ptr consequence;
    statement_ptr alternative;
};

struct while_statement final : statement
{
    while_statement(expression_ptr cond, statement_ptr loop_body)
        : condition {std::move(cond)}
        , body {std::move(loop_body)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    statement_ptr body;
};

struct function_statement final : statement
{
    function_statement(token identifier, std::vector<token> params, std::shared_ptr<const statement_list> stmts)
        : name {std::move(identifier)}
        , parameters {std::move(params)}
        , body {std::move(stmts)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name;
    std::vector<token> parameters;
    // co-owned by every closure created from this declaration
    std::shared_ptr<const statement_list> body;
};

struct return_statement final : statement
{
    return_statement(token kw, expression_ptr val)
        : keyword {std::move(kw)}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token keyword;
    expression_ptr value;
};

struct break_statement final : statement
{
    explicit break_statement(token kw)
        : keyword {std::move(kw)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token keyword;
};
