#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string_view>

#include <eval/environment.hpp>
#include <eval/evaluator.hpp>

enum class run_status : std::uint8_t
{
    success,
    static_error,
    runtime_failure,
};

// process exit code for a run outcome: 0, 65 or 70
auto exit_code(run_status status) -> int;

// runs source units against one global environment, so a REPL session shares its state across lines
class runner final
{
  public:
    runner(std::ostream& out, std::ostream& err, std::istream& in, bool debug = false);
    ~runner();

    runner(const runner&) = delete;
    runner(runner&&) = delete;
    auto operator=(const runner&) -> runner& = delete;
    auto operator=(runner&&) -> runner& = delete;

    auto run(std::string_view source) -> run_status;

  private:
    environment_ptr m_globals;
    evaluator m_evaluator;
    std::ostream& m_err;
    bool m_debug {};
};
