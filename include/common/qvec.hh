/*  Copyright (C) 2017 Eric Wasylishen

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

#include <algorithm>
#include <array>
#include <cstddef>
#include <type_traits>
#include <fmt/core.h>
#include <fmt/format.h>

// fixed-size value vector; only what the map readers need
template<class T, size_t N>
class qvec
{
protected:
    std::array<T, N> v{};

public:
    using value_type = T;

    constexpr qvec() = default;

    // copies up to N values, the rest stay zero
    template<typename... Args,
        typename = std::enable_if_t<sizeof...(Args) && std::is_convertible_v<std::common_type_t<Args...>, T>>>
    constexpr qvec(Args... a)
    {
        constexpr size_t copy_size = std::min(N, sizeof...(Args));
        size_t i = 0;
        ((i++ < copy_size ? (v[i - 1] = static_cast<T>(a), true) : false), ...);
    }

    [[nodiscard]] constexpr size_t size() const { return N; }

    [[nodiscard]] constexpr bool operator==(const qvec &other) const { return v == other.v; }
    [[nodiscard]] constexpr bool operator!=(const qvec &other) const { return v != other.v; }

    [[nodiscard]] constexpr const T &operator[](const size_t idx) const { return v[idx]; }
    [[nodiscard]] constexpr T &operator[](const size_t idx) { return v[idx]; }

    constexpr auto begin() { return v.begin(); }
    constexpr auto end() { return v.end(); }
    constexpr auto begin() const { return v.begin(); }
    constexpr auto end() const { return v.end(); }
};

using qvec2d = qvec<double, 2>;
using qvec3d = qvec<double, 3>;
using qvec4d = qvec<double, 4>;

// Fmt support
template<class T, size_t N>
struct fmt::formatter<qvec<T, N>> : formatter<T>
{
    template<typename FormatContext>
    auto format(const qvec<T, N> &p, FormatContext &ctx) const -> decltype(ctx.out())
    {
        for (size_t i = 0; i < N - 1; i++) {
            formatter<T>::format(p[i], ctx);
            fmt::format_to(ctx.out(), " ");
        }

        return formatter<T>::format(p[N - 1], ctx);
    }
};
