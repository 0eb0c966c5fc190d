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

#include <udmf/schema.hh>

#include <algorithm>

#include <common/log.hh>

namespace udmf
{
const char *field_type_name(field_type_t type)
{
    switch (type) {
        case field_type_t::boolean: return "bool";
        case field_type_t::int32: return "int32";
        case field_type_t::int64: return "int64";
        case field_type_t::uint32: return "uint32";
        case field_type_t::uint64: return "uint64";
        case field_type_t::float32: return "float";
        case field_type_t::float64: return "double";
        case field_type_t::string: return "string";
        default: FError("bad field type {}", static_cast<int>(type));
    }
}

void block_schema_t::add_field(std::string_view name, std::unique_ptr<field_base> field)
{
    if (_fields.find(name) != _fields.end()) {
        FError("field \"{}\" registered twice", name);
    }

    _fields.emplace(std::string(name), std::move(field));
}

const field_base *block_schema_t::find_field(std::string_view name) const
{
    if (auto it = _fields.find(name); it != _fields.end()) {
        return it->second.get();
    }

    return nullptr;
}

void document_schema_t::add_block_list(std::string_view tag, std::unique_ptr<block_list_base> list)
{
    if (_blocks.find(tag) != _blocks.end()) {
        FError("block list \"{}\" registered twice", tag);
    }

    _blocks.emplace(std::string(tag), std::move(list));
}

const block_list_base *document_schema_t::find_block_list(std::string_view tag) const
{
    if (auto it = _blocks.find(tag); it != _blocks.end()) {
        return it->second.get();
    }

    return nullptr;
}

size_t schema_cache_t::size() const
{
    std::lock_guard lock(_lock);

    // an entry whose describe() threw stays empty
    return std::count_if(_schemas.begin(), _schemas.end(), [](auto &entry) { return entry.second != nullptr; });
}

schema_cache_t &schema_cache_t::global()
{
    static schema_cache_t cache;
    return cache;
}
} // namespace udmf
