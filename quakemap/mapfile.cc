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

#include <quakemap/mapfile.hh>

#include <charconv>
#include <iterator>

#include <common/cmdlib.hh>
#include <common/log.hh>
#include <common/pool.hh>

namespace quakemap
{
size_t map_t::total_brushes() const
{
    size_t count = 0;

    for (auto &entity : entities) {
        count += entity.brushes.size();
    }

    return count;
}

size_t map_t::total_planes() const
{
    size_t count = 0;

    for (auto &entity : entities) {
        for (auto &brush : entity.brushes) {
            count += brush.planes.size();
        }
    }

    return count;
}

const token_t &parser_t::peek()
{
    return _scanner.peek();
}

token_t parser_t::next()
{
    token_t token = _scanner.read();

    if (token.type == token_type_t::brace_open) {
        _depth++;
    } else if (token.type == token_type_t::brace_close && _depth > 0) {
        _depth--;
    }

    return token;
}

void parser_t::error(const token_t &at, std::string message)
{
    _errors.push_back({std::move(message), at.line, at.column, at.start, at.length()});
}

std::string parser_t::describe(const token_t &token) const
{
    if (token.type == token_type_t::eof) {
        return "end of file";
    }

    return fmt::format("'{}'", string_strip_newlines(_scanner.source().substr(token.start, token.length())));
}

void parser_t::error_expected(const token_t &got, std::string_view expected)
{
    error(got, fmt::format("expected {}, got {}", expected, describe(got)));
}

bool parser_t::check_terminated(const token_t &token)
{
    if (token.unterminated) {
        error(token, "unterminated quoted string");
        return false;
    }

    return true;
}

bool parser_t::parse_number(double &out)
{
    const token_t token = next();
    const char *first = token.text.data();
    const char *last = first + token.text.size();

    if (token.type != token_type_t::integer && token.type != token_type_t::floating) {
        error_expected(token, "a number");
        return false;
    }

    // integers too: coordinates past the range of int64 are still valid
    double d;
    auto [ptr, ec] = std::from_chars(first, last, d);

    if (ec == std::errc() && ptr == last) {
        out = d;
        return true;
    }

    error(token, fmt::format("invalid number {}", describe(token)));
    return false;
}

bool parser_t::parse_point(qvec3d &out)
{
    token_t token = next();

    if (token.type != token_type_t::parens_open) {
        error_expected(token, "'('");
        return false;
    }

    for (size_t i = 0; i < 3; i++) {
        if (!parse_number(out[i])) {
            return false;
        }
    }

    token = next();

    if (token.type != token_type_t::parens_close) {
        error_expected(token, "')'");
        return false;
    }

    return true;
}

bool parser_t::parse_axis(qvec3d &axis, double &offset)
{
    token_t token = next();

    if (token.type != token_type_t::bracket_open) {
        error_expected(token, "'['");
        return false;
    }

    for (size_t i = 0; i < 3; i++) {
        if (!parse_number(axis[i])) {
            return false;
        }
    }

    if (!parse_number(offset)) {
        return false;
    }

    token = next();

    if (token.type != token_type_t::bracket_close) {
        error_expected(token, "']'");
        return false;
    }

    return true;
}

std::optional<plane_t> parser_t::parse_plane()
{
    plane_t plane;

    if (!parse_point(plane.point1) || !parse_point(plane.point2) || !parse_point(plane.point3)) {
        return std::nullopt;
    }

    // texture names are usually bare, but some editors quote them
    // or name them with nothing but digits
    token_t texture = next();

    switch (texture.type) {
        case token_type_t::quoted_string:
            if (!check_terminated(texture)) {
                return std::nullopt;
            }
            [[fallthrough]];
        case token_type_t::text:
        case token_type_t::integer:
        case token_type_t::floating: plane.texture = texture.text; break;
        default: error_expected(texture, "a texture name"); return std::nullopt;
    }

    if (peek().type == token_type_t::bracket_open) {
        plane.is_valve220 = true;

        if (!parse_axis(plane.axis1, plane.offsets[0]) || !parse_axis(plane.axis2, plane.offsets[1])) {
            return std::nullopt;
        }
    } else if (!parse_number(plane.offsets[0]) || !parse_number(plane.offsets[1])) {
        return std::nullopt;
    }

    if (!parse_number(plane.rotation) || !parse_number(plane.scale[0]) || !parse_number(plane.scale[1])) {
        return std::nullopt;
    }

    return plane;
}

std::optional<brush_t> parser_t::parse_brush()
{
    // the caller has seen the '{'
    next();

    pool::lease<plane_t> planes;

    while (true) {
        const token_t &token = peek();

        if (token.type == token_type_t::brace_close) {
            next();
            break;
        } else if (token.type == token_type_t::eof) {
            error(token, "unexpected end of file, expected a plane or '}'");
            return std::nullopt;
        } else if (token.type == token_type_t::parens_open) {
            auto plane = parse_plane();

            if (!plane) {
                return std::nullopt;
            }

            planes->push_back(std::move(*plane));
        } else {
            error_expected(token, "a plane or '}'");
            return std::nullopt;
        }
    }

    brush_t brush;
    brush.planes.assign(std::make_move_iterator(planes->begin()), std::make_move_iterator(planes->end()));
    planes->clear();
    return brush;
}

bool parser_t::parse_key_value(entdict_t &epairs)
{
    const token_t key = next();

    if (!check_terminated(key)) {
        return false;
    }

    const token_t value = next();

    if (value.type != token_type_t::quoted_string) {
        error_expected(value, "a quoted value");
        return false;
    }

    if (!check_terminated(value)) {
        return false;
    }

    // last one wins
    epairs.set(key.text, value.text);
    return true;
}

std::optional<entity_t> parser_t::parse_entity()
{
    const token_t open = next();

    if (open.type != token_type_t::brace_open) {
        error_expected(open, "'{'");
        return std::nullopt;
    }

    entity_t entity;
    pool::lease<brush_t> brushes;

    while (true) {
        const token_t &token = peek();

        if (token.type == token_type_t::brace_close) {
            next();
            break;
        } else if (token.type == token_type_t::eof) {
            error(token, "unexpected end of file, expected a key/value pair, a brush or '}'");
            return std::nullopt;
        } else if (token.type == token_type_t::quoted_string) {
            if (!parse_key_value(entity.epairs)) {
                return std::nullopt;
            }
        } else if (token.type == token_type_t::brace_open) {
            auto brush = parse_brush();

            if (!brush) {
                return std::nullopt;
            }

            brushes->push_back(std::move(*brush));
        } else {
            error_expected(token, "a key/value pair, a brush or '}'");
            return std::nullopt;
        }
    }

    entity.brushes.assign(std::make_move_iterator(brushes->begin()), std::make_move_iterator(brushes->end()));
    brushes->clear();
    return entity;
}

// consume tokens until the entity we were in is closed
void parser_t::skip_entity()
{
    while (_depth > 0 && peek().type != token_type_t::eof) {
        next();
    }
}

// consume tokens up to the next top-level '{'
void parser_t::skip_to_entity()
{
    while (true) {
        const token_t &token = peek();

        if (token.type == token_type_t::eof || (token.type == token_type_t::brace_open && _depth == 0)) {
            return;
        }

        next();
    }
}

std::optional<map_t> parser_t::parse(std::string_view source)
{
    _scanner.init(source);
    _errors.clear();
    _depth = 0;

    map_t map;

    while (peek().type != token_type_t::eof) {
        if (peek().type != token_type_t::brace_open) {
            error_expected(peek(), "'{'");
            next();
            skip_to_entity();
            continue;
        }

        if (auto entity = parse_entity()) {
            map.entities.push_back(std::move(*entity));
        } else {
            skip_entity();
        }
    }

    if (!_errors.empty()) {
        return std::nullopt;
    }

    return map;
}

parse_result_t parse(std::string_view source)
{
    parser_t parser;
    parse_result_t result;
    result.map = parser.parse(source);
    result.errors = parser.errors();
    return result;
}
} // namespace quakemap
