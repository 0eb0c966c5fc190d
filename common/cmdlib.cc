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

#include <common/cmdlib.hh>

#include <algorithm>

static inline char ascii_tolower(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

int32_t Q_strcasecmp(std::string_view a, std::string_view b)
{
    const size_t n = std::min(a.size(), b.size());

    for (size_t i = 0; i < n; i++) {
        const unsigned char ca = ascii_tolower(a[i]);
        const unsigned char cb = ascii_tolower(b[i]);

        if (ca != cb) {
            return ca < cb ? -1 : 1;
        }
    }

    if (a.size() == b.size()) {
        return 0;
    }

    return a.size() < b.size() ? -1 : 1;
}

bool // mxd
string_iequals(std::string_view a, std::string_view b)
{
    size_t sz = a.size();
    if (b.size() != sz)
        return false;
    for (size_t i = 0; i < sz; ++i)
        if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
            return false;
    return true;
}

bool case_insensitive_less::operator()(std::string_view l, std::string_view r) const noexcept
{
    return Q_strcasecmp(l, r) < 0;
}

std::string_view::const_iterator string_ifind(std::string_view haystack, std::string_view needle)
{
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) { return ascii_tolower(a) == ascii_tolower(b); });
}

bool string_icontains(std::string_view haystack, std::string_view needle)
{
    return string_ifind(haystack, needle) != haystack.end();
}

std::string string_strip_newlines(std::string_view str)
{
    std::string result;
    result.reserve(str.size());

    for (char c : str) {
        if (c != '\r' && c != '\n') {
            result.push_back(c);
        }
    }

    return result;
}

time_point I_FloatTime()
{
    return qclock::now();
}
