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

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <common/qvec.hh>

namespace quakemap
{
using keyvalue_t = std::pair<std::string, std::string>;
using keyvalues_t = std::vector<keyvalue_t>;

// an entity's key/value pairs, in the order they were first seen.
// keys are case-sensitive, as in the engine.
class entdict_t
{
    keyvalues_t keyvalues;

    static std::optional<double> parse_float(std::string_view str);

public:
    entdict_t(std::initializer_list<keyvalue_t> l);
    entdict_t();

    // empty string if missing
    const std::string &get(std::string_view key) const;

    // nullopt if the key is missing or doesn't parse;
    // leading/trailing whitespace is allowed
    std::optional<int32_t> get_int(std::string_view key) const;
    std::optional<double> get_float(std::string_view key) const;
    // "true"/"false" in any case, or an integer (nonzero is true)
    std::optional<bool> get_bool(std::string_view key) const;

    // exactly N whitespace-separated numbers, e.g. "origin" "0 128 -64"
    template<size_t N>
    std::optional<qvec<double, N>> get_vector(std::string_view key) const
    {
        auto it = find(key);

        if (it == keyvalues.end()) {
            return std::nullopt;
        }

        qvec<double, N> result;
        std::string_view rest = it->second;

        for (size_t i = 0; i < N; i++) {
            auto start = rest.find_first_not_of(" \t");

            if (start == std::string_view::npos) {
                return std::nullopt;
            }

            rest.remove_prefix(start);
            auto end = rest.find_first_of(" \t");
            auto component = parse_float(rest.substr(0, end));

            if (!component) {
                return std::nullopt;
            }

            result[i] = *component;
            rest.remove_prefix(end == std::string_view::npos ? rest.size() : end);
        }

        if (rest.find_first_not_of(" \t") != std::string_view::npos) {
            return std::nullopt;
        }

        return result;
    }

    // overwrites an existing key in place
    void set(std::string_view key, std::string_view value);
    void remove(std::string_view key);

    keyvalues_t::iterator find(std::string_view key);
    keyvalues_t::const_iterator find(std::string_view key) const;

    bool has(std::string_view key) const;

    inline keyvalues_t::const_iterator begin() const { return keyvalues.begin(); }
    inline keyvalues_t::const_iterator end() const { return keyvalues.end(); }

    inline keyvalues_t::iterator begin() { return keyvalues.begin(); }
    inline keyvalues_t::iterator end() { return keyvalues.end(); }

    inline size_t size() const { return keyvalues.size(); }
    inline bool empty() const { return keyvalues.empty(); }

    // order-sensitive
    auto operator<=>(const entdict_t &other) const = default;
};
} // namespace quakemap
