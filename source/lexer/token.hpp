#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include <fmt/ostream.h>
#include <object/literal.hpp>

#include "token_type.hpp"

struct token final
{
    token_type type {};
    std::string lexeme;
    std::optional<literal> value {};
    std::size_t line {};
};

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};
