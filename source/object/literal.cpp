#include <charconv>
#include <cmath>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include "literal.hpp"

#include <fmt/format.h>
#include <overloaded.hpp>

#include "callable.hpp"

auto literal::type_name() const -> std::string_view
{
    return std::visit(overloaded {
                          [](const nil_type) { return "nil"; },
                          [](const bool) { return "bool"; },
                          [](const number_value) { return "number"; },
                          [](const string_value&) { return "string"; },
                          [](const callable_ptr&) { return "callable"; },
                      },
                      value);
}

auto literal::inspect() const -> std::string
{
    return std::visit(overloaded {
                          [](const nil_type) -> std::string { return "nil"; },
                          [](const bool val) -> std::string { return val ? "true" : "false"; },
                          [](const number_value num) -> std::string { return fmt::format("{:.2f}", num); },
                          [](const string_value& str) -> std::string { return str; },
                          [](const callable_ptr& fn) -> std::string { return fmt::format("<fn {}>", fn->name()); },
                      },
                      value);
}

auto is_truthy(const literal& val) -> bool
{
    if (val.is_nil()) {
        return false;
    }
    if (val.is<bool>()) {
        return val.as<bool>();
    }
    return true;
}

auto is_equal(const literal& lhs, const literal& rhs) -> bool
{
    return std::visit(overloaded {
                          [](const nil_type, const nil_type) { return true; },
                          [](const bool val1, const bool val2) { return val1 == val2; },
                          [](const number_value val1, const number_value val2) { return val1 == val2; },
                          [](const string_value& val1, const string_value& val2) { return val1 == val2; },
                          [](const auto&, const auto&) { return false; },
                      },
                      lhs.value,
                      rhs.value);
}

namespace
{
// rewrites a shortest-form "1.5e-07" as plain decimal "0.00000015"
auto expand_exponent(std::string_view repr) -> std::string
{
    const auto epos = repr.find('e');
    if (epos == std::string_view::npos) {
        return std::string {repr};
    }
    auto exponent_text = repr.substr(epos + 1);
    if (exponent_text.front() == '+') {
        exponent_text.remove_prefix(1);
    }
    auto exponent = 0;
    if (std::from_chars(exponent_text.data(), exponent_text.data() + exponent_text.size(), exponent).ec != std::errc {}) {
        return std::string {repr};
    }

    auto mantissa = repr.substr(0, epos);
    auto sign = std::string {};
    if (mantissa.front() == '-') {
        sign = "-";
        mantissa.remove_prefix(1);
    }
    const auto dot = mantissa.find('.');
    const auto int_digits = static_cast<int>(dot == std::string_view::npos ? mantissa.size() : dot);
    auto digits = std::string {mantissa.substr(0, dot)};
    if (dot != std::string_view::npos) {
        digits += mantissa.substr(dot + 1);
    }

    const auto point = int_digits + exponent;
    const auto size = static_cast<int>(digits.size());
    if (point <= 0) {
        return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
    }
    if (point >= size) {
        return sign + digits + std::string(static_cast<std::size_t>(point - size), '0');
    }
    const auto split = static_cast<std::size_t>(point);
    return sign + digits.substr(0, split) + "." + digits.substr(split);
}
}  // namespace

auto number_to_string(number_value num) -> std::string
{
    if (std::isnan(num)) {
        return "NaN";
    }
    return expand_exponent(fmt::format("{}", num));
}

auto operator<<(std::ostream& ostrm, const literal& val) -> std::ostream&
{
    return ostrm << val.inspect();
}
