/*  Copyright (C) 1996-1997  Id Software, Inc.

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

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ASCII-only; the formats we read are never localized
int32_t Q_strcasecmp(std::string_view a, std::string_view b);
bool string_iequals(std::string_view a, std::string_view b);

// transparent, so maps keyed on std::string can be searched with
// a std::string_view pointing into a source buffer
struct case_insensitive_less
{
    using is_transparent = void;

    bool operator()(std::string_view l, std::string_view r) const noexcept;
};

std::string_view::const_iterator string_ifind(std::string_view haystack, std::string_view needle);
bool string_icontains(std::string_view haystack, std::string_view needle);

// returns a copy of `str` with every \r and \n removed
std::string string_strip_newlines(std::string_view str);

using qclock = std::chrono::high_resolution_clock;
using duration = std::chrono::duration<double>;
using time_point = std::chrono::time_point<qclock, duration>;

time_point I_FloatTime();
