#pragma once

#include <istream>

#include <eval/environment.hpp>
#include <object/callable.hpp>

// seconds since the unix epoch
auto make_clock() -> native_function;

// one line from input including its newline, empty at end of input
auto make_read_input(std::istream& input) -> native_function;

auto define_builtins(environment& env, std::istream& input) -> void;
