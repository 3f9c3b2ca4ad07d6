#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include <diagnostic.hpp>
#include <object/literal.hpp>

#include "token.hpp"
#include "token_type.hpp"

class lexer final
{
  public:
    explicit lexer(std::string_view input);

    auto scan_tokens() -> std::vector<token>;
    [[nodiscard]] auto errors() const -> const std::vector<diagnostic>&;

  private:
    auto scan_token() -> void;
    auto read_char() -> char;
    [[nodiscard]] auto peek_char() const -> char;
    [[nodiscard]] auto peek_next_char() const -> char;
    [[nodiscard]] auto at_end() const -> bool;
    auto match(char expected) -> bool;
    auto add_token(token_type type, std::optional<literal> value = {}) -> void;
    auto skip_line_comment() -> void;
    auto skip_block_comment() -> void;
    auto read_string() -> void;
    auto read_number() -> void;
    auto read_identifier_or_keyword() -> void;
    auto new_error(std::size_t line, std::string_view message) -> void;

    std::string_view m_input;
    std::string_view::size_type m_start {0};
    std::string_view::size_type m_position {0};
    std::size_t m_line {1};
    std::vector<token> m_tokens;
    std::vector<diagnostic> m_errors;
};
