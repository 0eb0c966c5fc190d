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

#include <udmf/value.hh>

#include <common/log.hh>
#include <common/pool.hh>

namespace udmf
{
const char *value_type_name(value_type_t type)
{
    switch (type) {
        case value_type_t::boolean: return "bool";
        case value_type_t::integer: return "integer";
        case value_type_t::floating: return "float";
        case value_type_t::string: return "string";
        case value_type_t::identifier: return "identifier";
        default: FError("bad value type {}", static_cast<int>(type));
    }
}

unknown_assignment_t::unknown_assignment_t(bool value)
    : _value(value)
{
}

unknown_assignment_t::unknown_assignment_t(int64_t value)
    : _value(value)
{
}

unknown_assignment_t::unknown_assignment_t(double value)
    : _value(value)
{
}

unknown_assignment_t::unknown_assignment_t(quoted_string_t value)
    : _value(std::move(value))
{
}

unknown_assignment_t::unknown_assignment_t(identifier_t value)
    : _value(std::move(value))
{
}

value_type_t unknown_assignment_t::type() const
{
    return static_cast<value_type_t>(_value.index());
}

std::optional<bool> unknown_assignment_t::as_bool() const
{
    if (auto *v = std::get_if<bool>(&_value)) {
        return *v;
    }

    return std::nullopt;
}

std::optional<int64_t> unknown_assignment_t::as_int() const
{
    if (auto *v = std::get_if<int64_t>(&_value)) {
        return *v;
    }

    return std::nullopt;
}

std::optional<double> unknown_assignment_t::as_float() const
{
    if (auto *v = std::get_if<double>(&_value)) {
        return *v;
    }

    return std::nullopt;
}

std::optional<std::string_view> unknown_assignment_t::as_string() const
{
    if (auto *v = std::get_if<quoted_string_t>(&_value)) {
        return v->text;
    }

    return std::nullopt;
}

std::optional<std::string_view> unknown_assignment_t::as_identifier() const
{
    if (auto *v = std::get_if<identifier_t>(&_value)) {
        return v->text;
    }

    return std::nullopt;
}

bool unknown_assignment_t::get_bool(bool def) const
{
    return as_bool().value_or(def);
}

int64_t unknown_assignment_t::get_int(int64_t def) const
{
    return as_int().value_or(def);
}

double unknown_assignment_t::get_float(double def) const
{
    return as_float().value_or(def);
}

std::string_view unknown_assignment_t::get_string(std::string_view def) const
{
    return as_string().value_or(def);
}

std::string_view unknown_assignment_t::get_identifier(std::string_view def) const
{
    return as_identifier().value_or(def);
}

std::string unescape(std::string_view text)
{
    if (text.find('\\') == std::string_view::npos) {
        return std::string(text);
    }

    pool::lease<char> buffer(text.size());
    size_t length = 0;

    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];

        if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
            c = text[++i];
        }

        (*buffer)[length++] = c;
    }

    return std::string(buffer->data(), length);
}
} // namespace udmf
