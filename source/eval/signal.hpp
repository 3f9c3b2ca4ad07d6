#pragma once

#include <optional>
#include <string>
#include <variant>

#include <lexer/token.hpp>
#include <object/literal.hpp>

struct runtime_error
{
    token where;
    std::string message;
};

struct break_signal
{
};

struct return_signal
{
    literal value;
};

// the non-normal ways a statement completes
using control_signal = std::variant<runtime_error, break_signal, return_signal>;
using completion = std::optional<control_signal>;
using eval_result = std::variant<literal, control_signal>;
