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

#include <quakemap/scanner.hh>

#include <common/log.hh>

namespace quakemap
{
const char *token_type_name(token_type_t type)
{
    switch (type) {
        case token_type_t::none: return "nothing";
        case token_type_t::undetermined: return "undetermined token";
        case token_type_t::eof: return "end of file";
        case token_type_t::text: return "text";
        case token_type_t::integer: return "integer";
        case token_type_t::floating: return "float";
        case token_type_t::quoted_string: return "string";
        case token_type_t::brace_open: return "'{'";
        case token_type_t::brace_close: return "'}'";
        case token_type_t::parens_open: return "'('";
        case token_type_t::parens_close: return "')'";
        case token_type_t::bracket_open: return "'['";
        case token_type_t::bracket_close: return "']'";
        default: FError("bad token type {}", static_cast<int>(type));
    }
}

static inline bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

static inline bool is_alpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// texture names like +0button or *water1 must stay a single token
static inline bool is_text_start(char c)
{
    switch (c) {
        case '_':
        case '*':
        case '=':
        case '/':
        case '\\':
        case '+': return true;
        default: return is_alpha(c) || is_digit(c);
    }
}

static inline bool is_text_continue(char c)
{
    return is_text_start(c) || c == '-' || c == '.';
}

scanner_t::scanner_t(std::string_view source)
{
    init(source);
}

void scanner_t::init(std::string_view source)
{
    _source = source;
    _pos = 0;
    _line = 1;
    _line_start = 0;
    _lookahead.reset();
}

char scanner_t::current() const
{
    return _pos < _source.size() ? _source[_pos] : '\0';
}

char scanner_t::next_char() const
{
    return (_pos + 1) < _source.size() ? _source[_pos + 1] : '\0';
}

// never moves past the end, so every loop built on it terminates
void scanner_t::advance()
{
    if (_pos >= _source.size()) {
        return;
    }

    if (_source[_pos++] == '\n') {
        _line++;
        _line_start = _pos;
    }
}

void scanner_t::skip_whitespace_and_comments()
{
    while (true) {
        const char c = current();

        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '/' && next_char() == '/') {
            while (current() != '\n' && current() != '\0') {
                advance();
            }
        } else {
            return;
        }
    }
}

token_t scanner_t::scan()
{
    skip_whitespace_and_comments();

    token_t token;
    token.start = _pos;
    token.line = _line;
    token.column = column();

    auto finish = [&](token_type_t type) {
        token.type = type;
        token.end = _pos;
        Q_assert(token.end >= token.start);
        if (type != token_type_t::quoted_string) {
            token.text = _source.substr(token.start, token.length());
        }
        return token;
    };

    const char c = current();

    if (c == '\0') {
        return finish(token_type_t::eof);
    }

    switch (c) {
        case '"': {
            advance();
            const size_t text_start = _pos;

            while (current() != '"' && current() != '\0') {
                advance();
            }

            token.text = _source.substr(text_start, _pos - text_start);

            if (current() == '"') {
                advance();
            } else {
                token.unterminated = true;
            }

            return finish(token_type_t::quoted_string);
        }
        case '{': advance(); return finish(token_type_t::brace_open);
        case '}': advance(); return finish(token_type_t::brace_close);
        case '(': advance(); return finish(token_type_t::parens_open);
        case ')': advance(); return finish(token_type_t::parens_close);
        case '[': advance(); return finish(token_type_t::bracket_open);
        case ']': advance(); return finish(token_type_t::bracket_close);
        default: break;
    }

    if (c == '-' || is_digit(c)) {
        bool is_float = false;

        if (c == '-') {
            advance();
        }

        while (is_digit(current())) {
            advance();
        }

        if (current() == '.') {
            is_float = true;
            advance();

            while (is_digit(current())) {
                advance();
            }
        }

        if (current() == 'e' || current() == 'E') {
            is_float = true;
            advance();

            if (current() == '+' || current() == '-') {
                advance();
            }

            while (is_digit(current())) {
                advance();
            }
        }

        // digits running straight into letters ("128x", "0_door") are a name, not a number
        if (is_text_start(current())) {
            while (is_text_continue(current())) {
                advance();
            }

            return finish(token_type_t::text);
        }

        return finish(is_float ? token_type_t::floating : token_type_t::integer);
    }

    if (is_text_start(c)) {
        while (is_text_continue(current())) {
            advance();
        }

        return finish(token_type_t::text);
    }

    advance();
    return finish(token_type_t::undetermined);
}

const token_t &scanner_t::peek()
{
    if (!_lookahead) {
        _lookahead = scan();
    }

    return *_lookahead;
}

token_t scanner_t::read()
{
    token_t token = peek();
    _lookahead.reset();
    return token;
}
} // namespace quakemap
