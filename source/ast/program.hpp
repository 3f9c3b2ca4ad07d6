#pragma once

#include <memory>
#include <string>

#include "statement.hpp"

struct program final
{
    [[nodiscard]] auto string() const -> std::string;

    statement_list statements;
};

using program_ptr = std::unique_ptr<program>;
