#include <string>

#include <fmt/format.h>
#include <object/literal.hpp>

#include "assign_expression.hpp"
#include "binary_expression.hpp"
#include "call_expression.hpp"
#include "grouping_expression.hpp"
#include "literal_expression.hpp"
#include "logical_expression.hpp"
#include "ternary_expression.hpp"
#include "unary_expression.hpp"
#include "util.hpp"
#include "variable_expression.hpp"
#include "visitor.hpp"

auto assign_expression::string() const -> std::string
{
    return fmt::format("({} = {})", name.lexeme, value->string());
}

void assign_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto binary_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", left->string(), op.lexeme, right->string());
}

void binary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto call_expression::string() const -> std::string
{
    return fmt::format("{}({})", callee->string(), join(arguments, ", "));
}

void call_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto grouping_expression::string() const -> std::string
{
    return fmt::format("(group {})", inner->string());
}

void grouping_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto literal_expression::string() const -> std::string
{
    if (value.is<string_value>()) {
        return fmt::format(R"("{}")", value.as<string_value>());
    }
    if (value.is<number_value>()) {
        return number_to_string(value.as<number_value>());
    }
    return value.inspect();
}

void literal_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto logical_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", left->string(), op.lexeme, right->string());
}

void logical_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto ternary_expression::string() const -> std::string
{
    return fmt::format("({} ? {} : {})", condition->string(), consequence->string(), alternative->string());
}

void ternary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto unary_expression::string() const -> std::string
{
    return fmt::format("({}{})", op.lexeme, right->string());
}

void unary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto variable_expression::string() const -> std::string
{
    return name.lexeme;
}

void variable_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
