#include <ostream>

#include "token.hpp"

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&
{
    ostream << "token{" << token.type << ", `" << token.lexeme << "´";
    if (token.value.has_value()) {
        ostream << ", " << *token.value;
    }
    return ostream << ", line " << token.line << "}";
}
