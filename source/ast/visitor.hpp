#pragma once

#include "assign_expression.hpp"
#include "binary_expression.hpp"
#include "call_expression.hpp"
#include "grouping_expression.hpp"
#include "literal_expression.hpp"
#include "logical_expression.hpp"
#include "statements.hpp"
#include "ternary_expression.hpp"
#include "unary_expression.hpp"
#include "variable_expression.hpp"

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const assign_expression& expr) = 0;
    virtual void visit(const binary_expression& expr) = 0;
    virtual void visit(const call_expression& expr) = 0;
    virtual void visit(const grouping_expression& expr) = 0;
    virtual void visit(const literal_expression& expr) = 0;
    virtual void visit(const logical_expression& expr) = 0;
    virtual void visit(const ternary_expression& expr) = 0;
    virtual void visit(const unary_expression& expr) = 0;
    virtual void visit(const variable_expression& expr) = 0;

    virtual void visit(const block_statement& stmt) = 0;
    virtual void visit(const break_statement& stmt) = 0;
    virtual void visit(const expression_statement& stmt) = 0;
    virtual void visit(const function_statement& stmt) = 0;
    virtual void visit(const if_statement& stmt) = 0;
    virtual void visit(const print_statement& stmt) = 0;
    virtual void visit(const return_statement& stmt) = 0;
    virtual void visit(const var_statement& stmt) = 0;
    virtual void visit(const while_statement& stmt) = 0;
};
