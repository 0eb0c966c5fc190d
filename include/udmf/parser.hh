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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <udmf/scanner.hh>
#include <udmf/schema.hh>
#include <udmf/value.hh>

#include <fmt/core.h>

namespace udmf
{
enum class parse_error_code_t : uint16_t
{
    invalid_global_expression = 0x0002,
    unexpected_token = 0x1001,
    type_mismatch = 0x1002,
    duplicate_assignment = 0x1003,
    invalid_number = 0x1004,
    invalid_character = 0x1005
};

struct parse_error_t
{
    std::string message;
    parse_error_code_t code = parse_error_code_t::unexpected_token;
    size_t line = 0;
    size_t column = 0;
    size_t position = 0;
    size_t length = 0;
};

/**
 * Descent parser binding a TEXTMAP source onto a document type through its
 * schema. Errors never stop the parse: the statement they occur in is
 * skipped up to its `;` (or the `}` / end of file that ends its block)
 * and parsing carries on. The document is always returned; it only gets
 * post_process()ed when there were no errors.
 *
 * Not reentrant; use one parser per thread. Parsers may share a cache.
 */
class parser_t
{
    schema_cache_t &_cache;
    scanner_t _scanner;
    std::vector<parse_error_t> _errors;

    const token_t &peek();
    token_t next();

    void error(const token_t &at, parse_error_code_t code, std::string message);
    void error_unexpected(const token_t &got, std::string_view expected);
    std::string describe(const token_t &token) const;

    void skip_statement();

    void parse_global_expression(document_t &document, const document_schema_t &schema);
    void parse_block(document_t &document, const document_schema_t &schema, const token_t &tag);
    void parse_assignment_list(bindable_t *target, const block_schema_t *schema, unknown_assignments_t &unknowns);
    void parse_assignment(
        bindable_t *target, const block_schema_t *schema, unknown_assignments_t &unknowns, const token_t &key);

    std::optional<field_value_t> convert_field(const field_base &field, const token_t &value);
    std::optional<unknown_assignment_t> convert_unknown(const token_t &value);

public:
    explicit parser_t(schema_cache_t &cache = schema_cache_t::global());

    // the source must outlive the call; the document doesn't refer to it
    void parse_into(std::string_view source, document_t &document, const document_schema_t &schema);

    template<typename D>
    D parse(std::string_view source)
    {
        D document;
        parse_into(source, document, _cache.get<D>());
        return document;
    }

    inline const std::vector<parse_error_t> &errors() const { return _errors; }
    inline schema_cache_t &cache() const { return _cache; }
};

template<typename D>
D parse(std::string_view source, std::vector<parse_error_t> &errors)
{
    parser_t parser;
    D document = parser.parse<D>(source);
    errors = parser.errors();
    return document;
}
} // namespace udmf

template<>
struct fmt::formatter<udmf::parse_error_t>
{
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.end(); }

    template<typename FormatContext>
    auto format(const udmf::parse_error_t &e, FormatContext &ctx) const -> decltype(ctx.out())
    {
        return fmt::format_to(ctx.out(), "{}:{}: {} (0x{:04x})", e.line, e.column, e.message, static_cast<uint16_t>(e.code));
    }
};
