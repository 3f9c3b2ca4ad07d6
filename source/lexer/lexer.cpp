#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "lexer.hpp"

#include <diagnostic.hpp>
#include <object/literal.hpp>

#include "token.hpp"
#include "token_type.hpp"

namespace
{
constexpr auto lookup_table_size = static_cast<std::size_t>(std::numeric_limits<unsigned char>::max()) + 1;
using char_literal_lookup_table = std::array<token_type, lookup_table_size>;

// eof marks characters that are not a single character token
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(eof);
    arr['('] = lparen;
    arr[')'] = rparen;
    arr['{'] = lsquirly;
    arr['}'] = rsquirly;
    arr[','] = comma;
    arr['.'] = dot;
    arr['-'] = minus;
    arr['+'] = plus;
    arr[';'] = semicolon;
    arr['*'] = asterisk;
    arr['?'] = question;
    arr[':'] = colon;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();

// operators that turn into their two character form when followed by '='
struct equal_suffixed
{
    char first;
    token_type single;
    token_type with_equal;
};

constexpr std::array equal_suffixed_tokens {
    equal_suffixed {'!', token_type::exclamation, token_type::not_equals},
    equal_suffixed {'=', token_type::assign, token_type::equals},
    equal_suffixed {'<', token_type::less_than, token_type::less_equal},
    equal_suffixed {'>', token_type::greater_than, token_type::greater_equal},
};

constexpr auto keyword_count = 17;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"and", token_type::logical_and},
        std::pair {"class", token_type::klass},
        std::pair {"else", token_type::elze},
        std::pair {"false", token_type::fals},
        std::pair {"for", token_type::fore},
        std::pair {"fun", token_type::fun},
        std::pair {"if", token_type::eef},
        std::pair {"nil", token_type::nil},
        std::pair {"or", token_type::logical_or},
        std::pair {"print", token_type::print},
        std::pair {"return", token_type::ret},
        std::pair {"super", token_type::super},
        std::pair {"this", token_type::thiz},
        std::pair {"true", token_type::tru},
        std::pair {"var", token_type::var},
        std::pair {"while", token_type::hwile},
        std::pair {"break", token_type::brake},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

}  // namespace

lexer::lexer(std::string_view input)
    : m_input {input}
{
}

auto lexer::scan_tokens() -> std::vector<token>
{
    while (!at_end()) {
        m_start = m_position;
        scan_token();
    }
    m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .value = {}, .line = m_line});
    return std::move(m_tokens);
}

auto lexer::errors() const -> const std::vector<diagnostic>&
{
    return m_errors;
}

auto lexer::scan_token() -> void
{
    const auto chr = read_char();
    if (const auto single = char_literal_tokens[static_cast<unsigned char>(chr)]; single != token_type::eof) {
        add_token(single);
        return;
    }
    const auto suffixed = std::find_if(equal_suffixed_tokens.cbegin(),
                                       equal_suffixed_tokens.cend(),
                                       [chr](const auto& entry) { return entry.first == chr; });
    if (suffixed != equal_suffixed_tokens.cend()) {
        add_token(match('=') ? suffixed->with_equal : suffixed->single);
        return;
    }
    switch (chr) {
        case '/':
            if (match('/')) {
                skip_line_comment();
            } else if (match('*')) {
                skip_block_comment();
            } else {
                add_token(token_type::slash);
            }
            return;
        case '"':
            read_string();
            return;
        case ' ':
        case '\r':
        case '\t':
            return;
        case '\n':
            m_line++;
            return;
        default:
            break;
    }
    if (is_digit(chr)) {
        read_number();
        return;
    }
    if (is_letter(chr)) {
        read_identifier_or_keyword();
        return;
    }
    new_error(m_line, "Unexpected character.");
}

auto lexer::read_char() -> char
{
    return m_input[m_position++];
}

auto lexer::peek_char() const -> char
{
    if (at_end()) {
        return '\0';
    }
    return m_input[m_position];
}

auto lexer::peek_next_char() const -> char
{
    if (m_position + 1 >= m_input.size()) {
        return '\0';
    }
    return m_input[m_position + 1];
}

auto lexer::at_end() const -> bool
{
    return m_position >= m_input.size();
}

auto lexer::match(char expected) -> bool
{
    if (at_end() || m_input[m_position] != expected) {
        return false;
    }
    m_position++;
    return true;
}

auto lexer::add_token(token_type type, std::optional<literal> value) -> void
{
    m_tokens.push_back(token {
        .type = type,
        .lexeme = std::string {m_input.substr(m_start, m_position - m_start)},
        .value = std::move(value),
        .line = m_line,
    });
}

auto lexer::skip_line_comment() -> void
{
    while (!at_end() && peek_char() != '\n') {
        read_char();
    }
}

auto lexer::skip_block_comment() -> void
{
    while (!at_end()) {
        if (peek_char() == '*' && peek_next_char() == '/') {
            read_char();
            read_char();
            return;
        }
        if (read_char() == '\n') {
            m_line++;
        }
    }
}

auto lexer::read_string() -> void
{
    const auto start_line = m_line;
    while (!at_end() && peek_char() != '"') {
        if (read_char() == '\n') {
            m_line++;
        }
    }
    if (at_end()) {
        new_error(start_line, "Unterminated string.");
        return;
    }
    read_char();
    const auto contents = m_input.substr(m_start + 1, m_position - m_start - 2);
    add_token(token_type::string, literal {string_value {contents}});
}

auto lexer::read_number() -> void
{
    while (is_digit(peek_char())) {
        read_char();
    }
    if (peek_char() == '.' && is_digit(peek_next_char())) {
        read_char();
        while (is_digit(peek_char())) {
            read_char();
        }
    }
    const auto digits = m_input.substr(m_start, m_position - m_start);
    number_value num {};
    const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), num);
    if (result.ec == std::errc::result_out_of_range) {
        // too large becomes infinity, too small underflows to zero
        const auto overflows = digits.find_first_not_of('0') < digits.find('.');
        num = overflows ? std::numeric_limits<number_value>::infinity() : 0.0;
    }
    add_token(token_type::number, literal {num});
}

auto lexer::read_identifier_or_keyword() -> void
{
    while (is_letter(peek_char()) || is_digit(peek_char())) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(m_start, m_position - m_start);
    // MSVC compiler will not be happy with a const auto* const itr here
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    if (itr != keyword_tokens.end()) {
        add_token(itr->second);
        return;
    }
    // NOLINTEND(*-qualified-auto)
    add_token(token_type::ident);
}

auto lexer::new_error(std::size_t line, std::string_view message) -> void
{
    m_errors.push_back(diagnostic {.line = line, .where = {}, .message = std::string {message}});
}
