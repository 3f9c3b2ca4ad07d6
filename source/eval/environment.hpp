#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>

#include <object/literal.hpp>

struct environment;
using environment_ptr = std::shared_ptr<environment>;

// empty while a variable is declared but not yet assigned
using binding = std::optional<literal>;

struct environment final
{
    explicit environment(environment_ptr parent_env = {});

    auto define(const std::string& name, binding val) -> void;
    auto assign(const std::string& name, const literal& val) -> bool;
    [[nodiscard]] auto get(const std::string& name) const -> const binding*;

    // drops every binding reachable from this scope, including closures
    auto break_cycle() -> void;
    void debug(std::ostream& out) const;

    std::unordered_map<std::string, binding> store;
    environment_ptr enclosing;
};
