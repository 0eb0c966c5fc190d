/*
    Copyright (C) 1996-1997  Id Software, Inc.
    Copyright (C) 1997       Greg Lewis

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
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace fs
{
using namespace std::filesystem;

using data = std::optional<std::vector<uint8_t>>;

// attempt to load the specified file from disk; returns
// std::nullopt if it doesn't exist or can't be read.
data load(const path &p);

// view the loaded bytes as text. `d` must has_value() and
// outlive the returned view.
std::string_view as_text(const data &d);
}; // namespace fs

// Returns the path itself if it has an extension already, otherwise
// returns the path with extension replaced with `extension`.
fs::path DefaultExtension(const fs::path &path, const fs::path &extension);

#include <fmt/core.h>

template<>
struct fmt::formatter<fs::path>
{
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.end(); }

    template<typename FormatContext>
    auto format(const fs::path &p, FormatContext &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", p.string());
    }
};
