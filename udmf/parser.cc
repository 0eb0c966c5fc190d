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

#include <udmf/parser.hh>

#include <charconv>
#include <limits>
#include <type_traits>

#include <common/cmdlib.hh>
#include <common/log.hh>

namespace udmf
{
static std::optional<bool> bool_from_text(std::string_view text)
{
    if (string_iequals(text, "true")) {
        return true;
    } else if (string_iequals(text, "false")) {
        return false;
    }

    return std::nullopt;
}

static std::optional<uint64_t> parse_magnitude(std::string_view digits, int base)
{
    if (digits.empty()) {
        return std::nullopt;
    }

    uint64_t value;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);

    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }

    return value;
}

/**
 * Integer literal -> T. 0x-prefixed literals are hex; anything else is read
 * as decimal first, then as hex. A leading 0 doesn't make it octal.
 * nullopt if nothing fits in T.
 */
template<typename T>
static std::optional<T> parse_integer(std::string_view text)
{
    bool negative = false;

    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    std::optional<uint64_t> magnitude;

    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        magnitude = parse_magnitude(text.substr(2), 16);
    }

    if (!magnitude) {
        magnitude = parse_magnitude(text, 10);
    }

    if (!magnitude) {
        magnitude = parse_magnitude(text, 16);
    }

    if (!magnitude) {
        return std::nullopt;
    }

    if constexpr (std::is_signed_v<T>) {
        using U = std::make_unsigned_t<T>;
        const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<T>::max()) + (negative ? 1 : 0);

        if (*magnitude > limit) {
            return std::nullopt;
        }

        if (negative) {
            return static_cast<T>(static_cast<U>(0) - static_cast<U>(*magnitude));
        }

        return static_cast<T>(*magnitude);
    } else {
        if (negative && *magnitude != 0) {
            return std::nullopt;
        }

        if (*magnitude > std::numeric_limits<T>::max()) {
            return std::nullopt;
        }

        return static_cast<T>(*magnitude);
    }
}

// integer or float token -> T
template<typename T>
static std::optional<T> parse_real(const token_t &token)
{
    if (token.type == token_type_t::integer) {
        if (auto i = parse_integer<int64_t>(token.text)) {
            return static_cast<T>(*i);
        } else if (auto u = parse_integer<uint64_t>(token.text)) {
            return static_cast<T>(*u);
        }

        return std::nullopt;
    }

    std::string_view text = token.text;

    // from_chars doesn't take a leading '+'
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }

    T value;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);

    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }

    return value;
}

parser_t::parser_t(schema_cache_t &cache)
    : _cache(cache)
{
}

const token_t &parser_t::peek()
{
    return _scanner.peek();
}

token_t parser_t::next()
{
    return _scanner.read();
}

void parser_t::error(const token_t &at, parse_error_code_t code, std::string message)
{
    _errors.push_back({std::move(message), code, at.line, at.column, at.start, at.length()});
}

std::string parser_t::describe(const token_t &token) const
{
    if (token.type == token_type_t::eof) {
        return "end of file";
    }

    return fmt::format("token '{}'", string_strip_newlines(_scanner.source().substr(token.start, token.length())));
}

void parser_t::error_unexpected(const token_t &got, std::string_view expected)
{
    if (got.type == token_type_t::undetermined) {
        error(got, parse_error_code_t::invalid_character,
            fmt::format("Invalid {} found. Expected {}", describe(got), expected));
    } else if (got.type == token_type_t::quoted_string && got.unterminated) {
        error(got, parse_error_code_t::invalid_character,
            fmt::format("Unterminated string found. Expected {}", expected));
    } else {
        error(got, parse_error_code_t::unexpected_token,
            fmt::format("Unexpected {} found. Expected {}", describe(got), expected));
    }
}

// past the next ';', or up to (not including) the '}' or end of file
void parser_t::skip_statement()
{
    while (true) {
        const token_t &token = peek();

        if (token.type == token_type_t::eof || token.type == token_type_t::brace_close) {
            return;
        }

        if (next().type == token_type_t::semicolon) {
            return;
        }
    }
}

std::optional<field_value_t> parser_t::convert_field(const field_base &field, const token_t &value)
{
    auto mismatch = [&](std::string_view expected) -> std::optional<field_value_t> {
        error(value, parse_error_code_t::type_mismatch,
            fmt::format("Expected {}, got {}.", expected, token_type_name(value.type)));
        return std::nullopt;
    };

    auto integer = [&](auto type_tag) -> std::optional<field_value_t> {
        using T = decltype(type_tag);

        if (value.type != token_type_t::integer) {
            return mismatch(token_type_name(token_type_t::integer));
        }

        if (auto i = parse_integer<T>(value.text)) {
            return field_value_t(std::in_place_type<T>, *i);
        }

        error(value, parse_error_code_t::invalid_number,
            fmt::format("Integer '{}' is out of range for {}.", value.text, field_type_name(field.type())));
        return std::nullopt;
    };

    auto real = [&](auto type_tag) -> std::optional<field_value_t> {
        using T = decltype(type_tag);

        if (value.type != token_type_t::integer && value.type != token_type_t::floating) {
            return mismatch(token_type_name(token_type_t::floating));
        }

        if (auto f = parse_real<T>(value)) {
            return field_value_t(std::in_place_type<T>, *f);
        }

        error(value, parse_error_code_t::invalid_number, fmt::format("Invalid number '{}'.", value.text));
        return std::nullopt;
    };

    switch (field.type()) {
        case field_type_t::boolean:
            if (value.type == token_type_t::identifier) {
                if (auto b = bool_from_text(value.text)) {
                    return field_value_t(std::in_place_type<bool>, *b);
                }
            }

            return mismatch("bool");
        case field_type_t::int32: return integer(int32_t{});
        case field_type_t::int64: return integer(int64_t{});
        case field_type_t::uint32: return integer(uint32_t{});
        case field_type_t::uint64: return integer(uint64_t{});
        case field_type_t::float32: return real(float{});
        case field_type_t::float64: return real(double{});
        case field_type_t::string:
            if (value.type != token_type_t::quoted_string) {
                return mismatch(token_type_name(token_type_t::quoted_string));
            }

            return field_value_t(std::in_place_type<std::string>, unescape(value.text));
        default: FError("bad field type {}", static_cast<int>(field.type()));
    }
}

std::optional<unknown_assignment_t> parser_t::convert_unknown(const token_t &value)
{
    switch (value.type) {
        case token_type_t::identifier:
            if (auto b = bool_from_text(value.text)) {
                return unknown_assignment_t(*b);
            }

            return unknown_assignment_t(identifier_t{std::string(value.text)});
        case token_type_t::integer:
            if (auto i = parse_integer<int64_t>(value.text)) {
                return unknown_assignment_t(*i);
            }

            error(value, parse_error_code_t::invalid_number,
                fmt::format("Integer '{}' is out of range for int64.", value.text));
            return std::nullopt;
        case token_type_t::floating:
            if (auto f = parse_real<double>(value)) {
                return unknown_assignment_t(*f);
            }

            error(value, parse_error_code_t::invalid_number, fmt::format("Invalid number '{}'.", value.text));
            return std::nullopt;
        case token_type_t::quoted_string: return unknown_assignment_t(quoted_string_t{unescape(value.text)});
        default: FError("{} is not a value", token_type_name(value.type));
    }
}

static bool is_value(const token_t &token)
{
    switch (token.type) {
        case token_type_t::identifier:
        case token_type_t::integer:
        case token_type_t::floating: return true;
        case token_type_t::quoted_string: return !token.unterminated;
        default: return false;
    }
}

// the key has been read
void parser_t::parse_assignment(
    bindable_t *target, const block_schema_t *schema, unknown_assignments_t &unknowns, const token_t &key)
{
    if (peek().type != token_type_t::equals) {
        error_unexpected(peek(), token_type_name(token_type_t::equals));
        skip_statement();
        return;
    }

    next();

    if (!is_value(peek())) {
        error_unexpected(peek(), "a value");
        skip_statement();
        return;
    }

    const token_t value = next();
    const field_base *field = schema ? schema->find_field(key.text) : nullptr;

    std::optional<field_value_t> field_value;
    std::optional<unknown_assignment_t> unknown_value;

    if (field) {
        field_value = convert_field(*field, value);
    } else {
        unknown_value = convert_unknown(value);
    }

    if (peek().type != token_type_t::semicolon) {
        error_unexpected(peek(), token_type_name(token_type_t::semicolon));
        skip_statement();
        return;
    }

    next();

    if (field_value) {
        // a known key given twice just takes the last value
        field->assign(*target, std::move(*field_value));
    } else if (unknown_value) {
        auto [it, inserted] = unknowns.try_emplace(std::string(key.text), std::move(*unknown_value));

        if (!inserted) {
            error(key, parse_error_code_t::duplicate_assignment, fmt::format("duplicate assignment '{}'", key.text));
        }
    }
}

void parser_t::parse_assignment_list(bindable_t *target, const block_schema_t *schema, unknown_assignments_t &unknowns)
{
    while (true) {
        const token_t &token = peek();

        if (token.type == token_type_t::brace_close || token.type == token_type_t::eof) {
            return;
        }

        if (token.type != token_type_t::identifier) {
            error_unexpected(token, token_type_name(token_type_t::identifier));
            skip_statement();
            continue;
        }

        const token_t key = next();
        parse_assignment(target, schema, unknowns, key);
    }
}

// the tag has been read, and the '{' is next
void parser_t::parse_block(document_t &document, const document_schema_t &schema, const token_t &tag)
{
    next();

    if (auto *list = schema.find_block_list(tag.text)) {
        block_t &block = list->append(document);
        parse_assignment_list(&block, &list->schema(), block.unknown_assignments);
    } else {
        auto it = document.unknown_blocks.find(tag.text);

        if (it == document.unknown_blocks.end()) {
            it = document.unknown_blocks.emplace(std::string(tag.text), std::vector<unknown_block_t>{}).first;
        }

        unknown_block_t &block = it->second.emplace_back();
        parse_assignment_list(nullptr, nullptr, block.unknown_assignments);
    }

    if (peek().type != token_type_t::brace_close) {
        error_unexpected(peek(), token_type_name(token_type_t::brace_close));
        return;
    }

    next();
}

void parser_t::parse_global_expression(document_t &document, const document_schema_t &schema)
{
    const token_t ident = next();

    if (ident.type != token_type_t::identifier) {
        // one token at a time until something starts a new expression
        error_unexpected(ident, token_type_name(token_type_t::identifier));
        return;
    }

    switch (peek().type) {
        case token_type_t::brace_open: parse_block(document, schema, ident); break;
        case token_type_t::equals:
            parse_assignment(&document, &schema.globals(), document.unknown_global_assignments, ident);
            break;
        default:
            error(peek(), parse_error_code_t::invalid_global_expression,
                fmt::format("Unexpected {} found.", describe(peek())));
            skip_statement();
            break;
    }
}

void parser_t::parse_into(std::string_view source, document_t &document, const document_schema_t &schema)
{
    _scanner.init(source);
    _errors.clear();

    while (peek().type != token_type_t::eof) {
        parse_global_expression(document, schema);
    }

    if (_errors.empty()) {
        document.post_process();
    }
}
} // namespace udmf
