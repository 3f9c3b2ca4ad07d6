#include <iterator>
#include <string>
#include <vector>

#include "statements.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "program.hpp"
#include "util.hpp"
#include "visitor.hpp"

auto block_statement::string() const -> std::string
{
    return fmt::format("{{ {} }}", join(statements, " "));
}

void block_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto expression_statement::string() const -> std::string
{
    return fmt::format("{};", expr->string());
}

void expression_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto print_statement::string() const -> std::string
{
    return fmt::format("print {};", expr->string());
}

void print_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto var_statement::string() const -> std::string
{
    if (initializer) {
        return fmt::format("var {} = {};", name.lexeme, initializer->string());
    }
    return fmt::format("var {};", name.lexeme);
}

void var_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto if_statement::string() const -> std::string
{
    if (alternative) {
        return fmt::format("if {} {} else {}", condition->string(), consequence->string(), alternative->string());
    }
    return fmt::format("if {} {}", condition->string(), consequence->string());
}

void if_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto while_statement::string() const -> std::string
{
    return fmt::format("while {} {}", condition->string(), body->string());
}

void while_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto function_statement::string() const -> std::string
{
    auto params = std::vector<std::string>();
    params.reserve(parameters.size());
    for (const auto& param : parameters) {
        params.push_back(param.lexeme);
    }
    return fmt::format("fun {}({}) {{ {} }}", name.lexeme, fmt::join(params, ", "), join(*body, " "));
}

void function_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto return_statement::string() const -> std::string
{
    if (value) {
        return fmt::format("return {};", value->string());
    }
    return "return;";
}

void return_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto break_statement::string() const -> std::string
{
    return "break;";
}

void break_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto program::string() const -> std::string
{
    return join(statements, "\n");
}
