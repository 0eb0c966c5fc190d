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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <common/qvec.hh>
#include <quakemap/entdata.hh>
#include <quakemap/scanner.hh>

#include <fmt/core.h>

namespace quakemap
{
// one brush face. legacy (QuakeEd) faces leave both axes at zero;
// Valve 220 faces carry the two texture axes, with their fourth
// components in `offsets`.
struct plane_t
{
    qvec3d point1{}, point2{}, point3{};
    std::string texture;
    bool is_valve220 = false;
    qvec3d axis1{}, axis2{};
    qvec2d offsets{};
    double rotation = 0;
    qvec2d scale{};
};

struct brush_t
{
    std::vector<plane_t> planes;
};

struct entity_t
{
    entdict_t epairs;
    std::vector<brush_t> brushes;
};

struct map_t
{
    std::vector<entity_t> entities;

    size_t total_brushes() const;
    size_t total_planes() const;
};

struct parse_error_t
{
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t position = 0;
    size_t length = 0;
};

struct parse_result_t
{
    // absent whenever `errors` isn't empty
    std::optional<map_t> map;
    std::vector<parse_error_t> errors;

    inline bool ok() const { return map.has_value() && errors.empty(); }
};

/**
 * Recursive-descent reader for .map sources.
 *
 * A structural error abandons the entity it occurs in; the parser then
 * skips to the brace closing that entity and carries on with the next one,
 * so every broken entity gets reported. Any error means no map is returned.
 *
 * Not reentrant; use one parser per thread.
 */
class parser_t
{
    scanner_t _scanner;
    std::vector<parse_error_t> _errors;
    // brace nesting of the tokens read so far, for resynchronizing
    int32_t _depth = 0;

    const token_t &peek();
    token_t next();

    void error(const token_t &at, std::string message);
    void error_expected(const token_t &got, std::string_view expected);
    std::string describe(const token_t &token) const;
    bool check_terminated(const token_t &token);

    std::optional<entity_t> parse_entity();
    bool parse_key_value(entdict_t &epairs);
    std::optional<brush_t> parse_brush();
    std::optional<plane_t> parse_plane();
    bool parse_point(qvec3d &out);
    bool parse_axis(qvec3d &axis, double &offset);
    bool parse_number(double &out);

    void skip_entity();
    void skip_to_entity();

public:
    // the source must outlive the call; nothing in the result refers to it
    std::optional<map_t> parse(std::string_view source);

    inline const std::vector<parse_error_t> &errors() const { return _errors; }
};

parse_result_t parse(std::string_view source);
} // namespace quakemap

template<>
struct fmt::formatter<quakemap::parse_error_t>
{
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.end(); }

    template<typename FormatContext>
    auto format(const quakemap::parse_error_t &e, FormatContext &ctx) const -> decltype(ctx.out())
    {
        return fmt::format_to(ctx.out(), "{}:{}: {}", e.line, e.column, e.message);
    }
};
