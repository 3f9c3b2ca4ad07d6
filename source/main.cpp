#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <runner/runner.hpp>

namespace
{
constexpr auto prompt = "> ";
constexpr auto exit_usage = 64;
constexpr auto exit_host_failure = 1;

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
    // set when the command line itself is malformed
    std::optional<std::string> error;
};

auto show_usage(std::string_view program, const std::optional<std::string>& error_msg = {}) -> int
{
    if (error_msg.has_value()) {
        fmt::print(std::cerr, "Error: {}\n", *error_msg);
    }
    fmt::print(std::cerr, "Usage: {} [-h] [-d] [script]\n", program);
    return error_msg.has_value() ? exit_usage : 0;
}

auto parse_command_line(int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<std::size_t>(argc))) {
        if (arg.size() > 1 && arg[0] == '-') {
            if (arg == "-h") {
                opts.help = true;
            } else if (arg == "-d") {
                opts.debug = true;
            } else {
                opts.error = fmt::format("invalid option {}", arg);
            }
            continue;
        }
        if (!opts.file.empty()) {
            opts.error = fmt::format("unexpected argument {}, already have script {}", arg, opts.file);
            continue;
        }
        opts.file = arg;
    }
    return opts;
}

auto read_file(std::string_view path) -> std::string
{
    std::ifstream ifs(std::string {path});
    if (!ifs) {
        throw std::runtime_error(fmt::format("could not open file: {}", path));
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    if (ifs.bad()) {
        throw std::runtime_error(fmt::format("could not read file: {}", path));
    }
    return contents;
}

auto run_file(const command_line_args& opts) -> int
{
    auto contents = std::string {};
    try {
        contents = read_file(opts.file);
    } catch (const std::runtime_error& e) {
        fmt::print(std::cerr, "ERROR: {}\n", e.what());
        return exit_host_failure;
    }
    auto session = runner {std::cout, std::cerr, std::cin, opts.debug};
    return exit_code(session.run(contents));
}

auto run_repl(const command_line_args& opts) -> int
{
    auto session = runner {std::cout, std::cerr, std::cin, opts.debug};
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        // errors are reported by the runner and the session goes on
        static_cast<void>(session.run(input));
        show_prompt();
    }
    std::cout << '\n';
    return 0;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    const auto opts = parse_command_line(argc - 1, ++argv);
    if (opts.error.has_value()) {
        return show_usage(program, opts.error);
    }
    if (opts.help) {
        return show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);
    } catch (const std::exception& e) {
        fmt::print(std::cerr, "Caught an exception: {}\n", e.what());
        return exit_host_failure;
    }
}
