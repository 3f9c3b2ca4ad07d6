#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include <fmt/ostream.h>
#include <lexer/token.hpp>

// A located error message, rendered as `[line N] Error<where>: <message>`.
struct diagnostic final
{
    static auto at(const token& tkn, std::string message) -> diagnostic;

    std::size_t line {};
    std::string where;
    std::string message;

    auto operator==(const diagnostic& other) const -> bool = default;
};

auto operator<<(std::ostream& ostrm, const diagnostic& diag) -> std::ostream&;

template<>
struct fmt::formatter<diagnostic> : ostream_formatter
{
};
