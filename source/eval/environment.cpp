#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>

#include "environment.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <object/callable.hpp>
#include <object/literal.hpp>

environment::environment(environment_ptr parent_env)
    : enclosing {std::move(parent_env)}
{
}

auto environment::define(const std::string& name, binding val) -> void
{
    store.insert_or_assign(name, std::move(val));
}

auto environment::assign(const std::string& name, const literal& val) -> bool
{
    for (auto* ptr = this; ptr != nullptr; ptr = ptr->enclosing.get()) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            itr->second = val;
            return true;
        }
    }
    return false;
}

auto environment::get(const std::string& name) const -> const binding*
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->enclosing.get()) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            return &itr->second;
        }
    }
    return nullptr;
}

auto environment::break_cycle() -> void
{
    auto bindings = std::move(store);
    store.clear();
    for (auto& [name, val] : bindings) {
        if (!val || !val->is<callable_ptr>()) {
            continue;
        }
        const auto& fn = val->as<callable_ptr>();
        if (const auto* user = std::get_if<user_function>(&fn->impl); user != nullptr && user->closure) {
            user->closure->break_cycle();
        }
    }
    if (enclosing) {
        enclosing->break_cycle();
    }
}

void environment::debug(std::ostream& out) const
{
    for (const auto& [name, val] : store) {
        fmt::print(out, "[{}] = {}\n", name, val ? val->inspect() : std::string {"<uninitialized>"});
    }
}
