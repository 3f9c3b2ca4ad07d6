#include <istream>
#include <memory>
#include <ostream>
#include <string_view>
#include <utility>

#include "runner.hpp"

#include <diagnostic.hpp>
#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto exit_static_error = 65;
constexpr auto exit_runtime_error = 70;
}  // namespace

auto exit_code(run_status status) -> int
{
    switch (status) {
        case run_status::success:
            return 0;
        case run_status::static_error:
            return exit_static_error;
        case run_status::runtime_failure:
            return exit_runtime_error;
    }
    return 0;
}

runner::runner(std::ostream& out, std::ostream& err, std::istream& in, bool debug)
    : m_globals {std::make_shared<environment>()}
    , m_evaluator {m_globals, out, in}
    , m_err {err}
    , m_debug {debug}
{
}

runner::~runner()
{
    m_evaluator.release_scopes();
}

auto runner::run(std::string_view source) -> run_status
{
    auto lxr = lexer {source};
    auto tokens = lxr.scan_tokens();
    if (!lxr.errors().empty()) {
        for (const auto& error : lxr.errors()) {
            fmt::print(m_err, "{}\n", error);
        }
        return run_status::static_error;
    }

    auto prsr = parser {std::move(tokens)};
    const auto prgrm = prsr.parse_program();
    if (!prsr.errors().empty()) {
        for (const auto& error : prsr.errors()) {
            fmt::print(m_err, "{}\n", error);
        }
        return run_status::static_error;
    }
    if (m_debug) {
        fmt::print(m_err, "{}\n", prgrm->string());
    }

    if (const auto error = m_evaluator.interpret(prgrm->statements); error.has_value()) {
        fmt::print(m_err, "{}\n", diagnostic::at(error->where, error->message));
        return run_status::runtime_failure;
    }
    if (m_debug) {
        m_globals->debug(m_err);
    }
    return run_status::success;
}
