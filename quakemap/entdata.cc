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

#include <quakemap/entdata.hh>

#include <charconv>

#include <common/cmdlib.hh>

namespace quakemap
{
static std::string_view trim(std::string_view str)
{
    auto start = str.find_first_not_of(" \t\r\n");

    if (start == std::string_view::npos) {
        return {};
    }

    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// from_chars doesn't take a leading '+'
static std::string_view strip_plus(std::string_view str)
{
    if (!str.empty() && str.front() == '+') {
        str.remove_prefix(1);
    }

    return str;
}

entdict_t::entdict_t(std::initializer_list<keyvalue_t> l)
    : keyvalues(l)
{
}

entdict_t::entdict_t() = default;

std::optional<double> entdict_t::parse_float(std::string_view str)
{
    str = strip_plus(trim(str));

    if (str.empty()) {
        return std::nullopt;
    }

    double value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }

    return value;
}

const std::string &entdict_t::get(std::string_view key) const
{
    if (auto it = find(key); it != keyvalues.end()) {
        return it->second;
    }

    static std::string empty;
    return empty;
}

std::optional<int32_t> entdict_t::get_int(std::string_view key) const
{
    auto it = find(key);

    if (it == keyvalues.end()) {
        return std::nullopt;
    }

    std::string_view str = strip_plus(trim(it->second));

    if (str.empty()) {
        return std::nullopt;
    }

    int32_t value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }

    return value;
}

std::optional<double> entdict_t::get_float(std::string_view key) const
{
    auto it = find(key);

    if (it == keyvalues.end()) {
        return std::nullopt;
    }

    return parse_float(it->second);
}

std::optional<bool> entdict_t::get_bool(std::string_view key) const
{
    auto it = find(key);

    if (it == keyvalues.end()) {
        return std::nullopt;
    }

    std::string_view str = trim(it->second);

    if (string_iequals(str, "true")) {
        return true;
    } else if (string_iequals(str, "false")) {
        return false;
    }

    if (auto i = get_int(key)) {
        return *i != 0;
    }

    return std::nullopt;
}

void entdict_t::set(std::string_view key, std::string_view value)
{
    // search for existing key to update
    if (auto it = find(key); it != keyvalues.end()) {
        // found existing key
        it->second = value;
        return;
    }

    // no existing key; add new
    keyvalues.emplace_back(key, value);
}

void entdict_t::remove(std::string_view key)
{
    if (auto it = find(key); it != keyvalues.end()) {
        keyvalues.erase(it);
    }
}

keyvalues_t::iterator entdict_t::find(std::string_view key)
{
    for (auto it = keyvalues.begin(); it != keyvalues.end(); ++it) {
        if (key == it->first) {
            return it;
        }
    }

    return keyvalues.end();
}

keyvalues_t::const_iterator entdict_t::find(std::string_view key) const
{
    for (auto it = keyvalues.begin(); it != keyvalues.end(); ++it) {
        if (key == it->first) {
            return it;
        }
    }

    return keyvalues.end();
}

bool entdict_t::has(std::string_view key) const
{
    return find(key) != end();
}
} // namespace quakemap
