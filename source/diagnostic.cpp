#include <ostream>
#include <string>
#include <utility>

#include "diagnostic.hpp"

#include <fmt/format.h>
#include <lexer/token_type.hpp>

auto diagnostic::at(const token& tkn, std::string message) -> diagnostic
{
    return diagnostic {
        .line = tkn.line,
        .where = tkn.type == token_type::eof ? std::string {"at end"} : fmt::format("at '{}'", tkn.lexeme),
        .message = std::move(message),
    };
}

auto operator<<(std::ostream& ostrm, const diagnostic& diag) -> std::ostream&
{
    ostrm << "[line " << diag.line << "] Error";
    if (!diag.where.empty()) {
        ostrm << ' ' << diag.where;
    }
    return ostrm << ": " << diag.message;
}
