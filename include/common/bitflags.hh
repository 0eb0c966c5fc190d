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

#include <type_traits>

// a set of flags from an enum whose enumerators are single bits
template<typename Enum>
struct bitflags
{
    static_assert(std::is_enum_v<Enum>, "Must be enum");

private:
    using type = std::underlying_type_t<Enum>;
    type _bits = 0;

    static constexpr bitflags from_bits(type bits)
    {
        bitflags f;
        f._bits = bits;
        return f;
    }

public:
    constexpr bitflags() = default;

    constexpr bitflags(Enum value)
        : _bits(static_cast<type>(value))
    {
    }

    constexpr explicit operator bool() const { return _bits != 0; }
    constexpr bool operator!() const { return _bits == 0; }

    constexpr operator Enum() const { return static_cast<Enum>(_bits); }

    constexpr bitflags &operator|=(bitflags r)
    {
        _bits |= r._bits;
        return *this;
    }
    constexpr bitflags &operator&=(bitflags r)
    {
        _bits &= r._bits;
        return *this;
    }

    constexpr bitflags operator|(bitflags r) const { return from_bits(_bits | r._bits); }
    constexpr bitflags operator&(bitflags r) const { return from_bits(_bits & r._bits); }
    constexpr bitflags operator~() const { return from_bits(static_cast<type>(~_bits)); }

    constexpr bool operator==(const bitflags &r) const = default;
};

// fetch integral representation of the value at bit N
template<typename T>
constexpr auto nth_bit(T l)
{
    return static_cast<T>(1) << l;
}
