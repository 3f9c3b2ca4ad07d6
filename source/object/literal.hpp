#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/ostream.h>

struct callable;
using callable_ptr = std::shared_ptr<const callable>;

using nil_type = std::monostate;
using number_value = double;
using string_value = std::string;

using literal_type = std::variant<nil_type, bool, number_value, string_value, callable_ptr>;

struct literal
{
    template<typename T>
    [[nodiscard]] auto is() const -> bool
    {
        return std::holds_alternative<T>(value);
    }

    [[nodiscard]] auto is_nil() const -> bool { return is<nil_type>(); }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        return std::get<T>(value);
    }

    [[nodiscard]] auto type_name() const -> std::string_view;

    // the form print writes
    [[nodiscard]] auto inspect() const -> std::string;

    literal_type value {};
};

// only nil and false are falsy
auto is_truthy(const literal& val) -> bool;

// total: never a type error, callables are unequal even to themselves
auto is_equal(const literal& lhs, const literal& rhs) -> bool;

// shortest round-trip digits in plain decimal form, used when a number is concatenated to a string
auto number_to_string(number_value num) -> std::string;

auto operator<<(std::ostream& ostrm, const literal& val) -> std::ostream&;

template<>
struct fmt::formatter<literal> : ostream_formatter
{
};
