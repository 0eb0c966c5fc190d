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
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <common/cmdlib.hh>

#include <fmt/core.h>

namespace udmf
{
enum class value_type_t : uint8_t
{
    boolean,
    integer,
    floating,
    string,
    identifier
};

const char *value_type_name(value_type_t type);

// a quoted string, already unescaped
struct quoted_string_t
{
    std::string text;

    auto operator<=>(const quoted_string_t &) const = default;
};

// a bare word that wasn't `true` or `false`
struct identifier_t
{
    std::string text;

    auto operator<=>(const identifier_t &) const = default;
};

/**
 * The value of an assignment the schema doesn't know about. The variant
 * index follows `value_type_t`.
 */
class unknown_assignment_t
{
public:
    using storage_t = std::variant<bool, int64_t, double, quoted_string_t, identifier_t>;

private:
    storage_t _value;

public:
    unknown_assignment_t() = default;
    explicit unknown_assignment_t(bool value);
    explicit unknown_assignment_t(int64_t value);
    explicit unknown_assignment_t(double value);
    explicit unknown_assignment_t(quoted_string_t value);
    explicit unknown_assignment_t(identifier_t value);

    value_type_t type() const;

    std::optional<bool> as_bool() const;
    std::optional<int64_t> as_int() const;
    std::optional<double> as_float() const;
    std::optional<std::string_view> as_string() const;
    std::optional<std::string_view> as_identifier() const;

    // the value if it holds that type, else `def`
    bool get_bool(bool def = false) const;
    int64_t get_int(int64_t def = 0) const;
    double get_float(double def = 0.0) const;
    std::string_view get_string(std::string_view def = {}) const;
    std::string_view get_identifier(std::string_view def = {}) const;

    inline const storage_t &value() const { return _value; }

    bool operator==(const unknown_assignment_t &) const = default;
};

// key names are matched without regard to case
using unknown_assignments_t = std::map<std::string, unknown_assignment_t, case_insensitive_less>;

struct unknown_block_t
{
    unknown_assignments_t unknown_assignments;
};

// blocks of unrecognized types, keyed by tag; each list is in source order
using unknown_blocks_t = std::map<std::string, std::vector<unknown_block_t>, case_insensitive_less>;

// anything a schema can bind fields on
struct bindable_t
{
};

// base for every declared block type
struct block_t : bindable_t
{
    unknown_assignments_t unknown_assignments;
};

/**
 * Base for every declared document type. The parser fills in the declared
 * fields and block lists, and collects whatever else it finds here.
 */
struct document_t : bindable_t
{
    unknown_assignments_t unknown_global_assignments;
    unknown_blocks_t unknown_blocks;

    document_t() = default;
    document_t(const document_t &) = default;
    document_t(document_t &&) = default;
    document_t &operator=(const document_t &) = default;
    document_t &operator=(document_t &&) = default;
    virtual ~document_t() = default;

    // runs once after a parse with no errors
    virtual void post_process() { }
};

// turns \" into " and \\ into a single backslash; any other backslash is kept
std::string unescape(std::string_view text);
} // namespace udmf

template<>
struct fmt::formatter<udmf::unknown_assignment_t>
{
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.end(); }

    template<typename FormatContext>
    auto format(const udmf::unknown_assignment_t &v, FormatContext &ctx) const -> decltype(ctx.out())
    {
        switch (v.type()) {
            case udmf::value_type_t::boolean: return fmt::format_to(ctx.out(), "{}", *v.as_bool());
            case udmf::value_type_t::integer: return fmt::format_to(ctx.out(), "{}", *v.as_int());
            case udmf::value_type_t::floating: return fmt::format_to(ctx.out(), "{}", *v.as_float());
            case udmf::value_type_t::string: return fmt::format_to(ctx.out(), "\"{}\"", *v.as_string());
            default: return fmt::format_to(ctx.out(), "{}", *v.as_identifier());
        }
    }
};
