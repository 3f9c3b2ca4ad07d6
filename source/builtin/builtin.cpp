#include <chrono>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "builtin.hpp"

#include <eval/environment.hpp>
#include <object/callable.hpp>
#include <object/literal.hpp>

auto make_clock() -> native_function
{
    return native_function {
        .name = "clock",
        .arity = 0,
        .body = [](const std::vector<literal>& /*arguments*/) -> literal
        {
            const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
            return literal {std::chrono::duration<number_value>(since_epoch).count()};
        },
    };
}

auto make_read_input(std::istream& input) -> native_function
{
    return native_function {
        .name = "read_input",
        .arity = 0,
        .body = [&input](const std::vector<literal>& /*arguments*/) -> literal
        {
            if (input.eof()) {
                return literal {string_value {}};
            }
            auto line = std::string {};
            if (!std::getline(input, line)) {
                if (input.eof()) {
                    return literal {string_value {}};
                }
                throw std::runtime_error("Error reading from stdin.");
            }
            if (!input.eof()) {
                line.push_back('\n');
            }
            return literal {std::move(line)};
        },
    };
}

auto define_builtins(environment& env, std::istream& input) -> void
{
    for (const auto& native : {make_clock(), make_read_input(input)}) {
        env.define(native.name, literal {std::make_shared<const callable>(callable {.impl = native})});
    }
}
