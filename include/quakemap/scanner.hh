/*  Copyright (C) 2024  mapscan authors

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA

    See file, 'COPYING', for details.
*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/core.h>

namespace quakemap
{
enum class token_type_t : uint8_t
{
    none,
    undetermined, // a character the scanner can't classify
    eof,
    text,
    integer,
    floating,
    quoted_string,
    brace_open,
    brace_close,
    parens_open,
    parens_close,
    bracket_open,
    bracket_close
};

const char *token_type_name(token_type_t type);

// a token never owns its characters; `text` points into the
// source handed to the scanner.
struct token_t
{
    token_type_t type = token_type_t::none;

    // for quoted strings, the characters between the quotes
    std::string_view text;

    // byte offsets of the whole token, quotes included
    size_t start = 0;
    size_t end = 0;

    size_t line = 1;
    size_t column = 1;

    // quoted string ran into the end of input
    bool unterminated = false;

    constexpr size_t length() const { return end - start; }
};

/**
 * Splits a .map source into tokens with one token of lookahead.
 * `\0` is treated as the end of input.
 */
class scanner_t
{
    std::string_view _source;
    size_t _pos = 0;
    size_t _line = 1;
    size_t _line_start = 0;
    std::optional<token_t> _lookahead;

    char current() const;
    char next_char() const;
    void advance();
    void skip_whitespace_and_comments();
    token_t scan();

public:
    scanner_t() = default;
    explicit scanner_t(std::string_view source);

    // start over on a new source; the source must outlive every token read from it
    void init(std::string_view source);

    // idempotent
    const token_t &peek();
    token_t read();

    inline std::string_view source() const { return _source; }
    inline size_t position() const { return _pos; }
    inline size_t line() const { return _line; }
    inline size_t column() const { return _pos - _line_start + 1; }
};
} // namespace quakemap

template<>
struct fmt::formatter<quakemap::token_type_t> : formatter<string_view>
{
    template<typename FormatContext>
    auto format(quakemap::token_type_t t, FormatContext &ctx) const
    {
        return formatter<string_view>::format(quakemap::token_type_name(t), ctx);
    }
};
