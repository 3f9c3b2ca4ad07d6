#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    eof,

    // single character tokens
    asterisk,
    colon,
    comma,
    dot,
    lparen,
    lsquirly,
    minus,
    plus,
    question,
    rparen,
    rsquirly,
    semicolon,
    slash,

    // one or two character tokens
    assign,
    equals,
    exclamation,
    not_equals,
    greater_than,
    greater_equal,
    less_than,
    less_equal,

    // multi character tokens
    ident,
    number,
    string,

    // keywords
    logical_and,
    klass,
    elze,
    fals,
    fore,
    fun,
    eef,
    nil,
    logical_or,
    print,
    ret,
    super,
    thiz,
    tru,
    var,
    hwile,
    brake,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
