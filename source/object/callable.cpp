#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "callable.hpp"

#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <eval/signal.hpp>
#include <overloaded.hpp>

auto callable::name() const -> std::string_view
{
    return std::visit([](const auto& fn) -> std::string_view { return fn.name; }, impl);
}

auto callable::arity() const -> std::size_t
{
    return std::visit(overloaded {
                          [](const user_function& fn) { return fn.parameters.size(); },
                          [](const native_function& fn) { return fn.arity; },
                      },
                      impl);
}

auto callable::call(evaluator& eval, std::vector<literal>&& arguments, const token& paren) const -> eval_result
{
    return std::visit(
        overloaded {
            [&](const user_function& fn) -> eval_result
            {
                auto locals = eval.make_scope(fn.closure);
                for (std::size_t idx = 0; idx < fn.parameters.size(); ++idx) {
                    locals->define(fn.parameters[idx].lexeme, std::move(arguments[idx]));
                }
                auto done = eval.execute_block(*fn.body, locals);
                if (!done) {
                    return literal {};
                }
                if (auto* ret = std::get_if<return_signal>(&*done); ret != nullptr) {
                    return std::move(ret->value);
                }
                return std::move(*done);
            },
            [&](const native_function& fn) -> eval_result
            {
                try {
                    return fn.body(arguments);
                } catch (const std::runtime_error& err) {
                    return control_signal {runtime_error {.where = paren, .message = err.what()}};
                }
            },
        },
        impl);
}
