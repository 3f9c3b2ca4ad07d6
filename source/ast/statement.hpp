#pragma once

#include <memory>
#include <string>
#include <vector>

struct statement
{
    statement() = default;
    virtual ~statement() = default;
    statement(const statement&) = delete;
    statement(statement&&) = delete;
    auto operator=(const statement&) -> statement& = delete;
    auto operator=(statement&&) -> statement& = delete;

    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;
};

using statement_ptr = std::unique_ptr<statement>;
using statement_list = std::vector<statement_ptr>;
