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
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <variant>
#include <vector>

#include <common/cmdlib.hh>
#include <udmf/value.hh>

namespace udmf
{
enum class field_type_t : uint8_t
{
    boolean,
    int32,
    int64,
    uint32,
    uint64,
    float32,
    float64,
    string
};

const char *field_type_name(field_type_t type);

// alternatives are in `field_type_t` order
using field_value_t = std::variant<bool, int32_t, int64_t, uint32_t, uint64_t, float, double, std::string>;

template<typename T>
constexpr field_type_t field_type_of()
{
    if constexpr (std::is_same_v<T, bool>) {
        return field_type_t::boolean;
    } else if constexpr (std::is_same_v<T, int32_t>) {
        return field_type_t::int32;
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return field_type_t::int64;
    } else if constexpr (std::is_same_v<T, uint32_t>) {
        return field_type_t::uint32;
    } else if constexpr (std::is_same_v<T, uint64_t>) {
        return field_type_t::uint64;
    } else if constexpr (std::is_same_v<T, float>) {
        return field_type_t::float32;
    } else if constexpr (std::is_same_v<T, double>) {
        return field_type_t::float64;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return field_type_t::string;
    } else {
        static_assert(!sizeof(T), "not a UDMF field type");
    }
}

// one bindable scalar: what it expects, and how to store it
class field_base
{
protected:
    field_type_t _type;

public:
    explicit field_base(field_type_t type)
        : _type(type)
    {
    }

    virtual ~field_base() = default;

    inline field_type_t type() const { return _type; }

    // `value` must hold the alternative matching type()
    virtual void assign(bindable_t &target, field_value_t &&value) const = 0;
};

template<typename T, typename F>
class member_field : public field_base
{
    F T::*_member;

public:
    explicit member_field(F T::*member)
        : field_base(field_type_of<F>()),
          _member(member)
    {
    }

    void assign(bindable_t &target, field_value_t &&value) const override
    {
        static_cast<T &>(target).*_member = std::get<F>(std::move(value));
    }
};

using field_map_t = std::map<std::string, std::unique_ptr<field_base>, case_insensitive_less>;

class block_schema_t
{
    field_map_t _fields;

public:
    // throws if `name` is already taken
    void add_field(std::string_view name, std::unique_ptr<field_base> field);

    // nullptr if not declared
    const field_base *find_field(std::string_view name) const;

    inline const field_map_t &fields() const { return _fields; }
};

// a declared list of blocks on a document
class block_list_base
{
protected:
    block_schema_t _schema;

public:
    virtual ~block_list_base() = default;

    inline const block_schema_t &schema() const { return _schema; }
    inline block_schema_t &schema() { return _schema; }

    // adds a default-constructed element to the list and returns it
    virtual block_t &append(document_t &document) const = 0;
};

template<typename D, typename B>
class member_block_list : public block_list_base
{
    std::vector<B> D::*_member;

public:
    explicit member_block_list(std::vector<B> D::*member)
        : _member(member)
    {
    }

    block_t &append(document_t &document) const override
    {
        return (static_cast<D &>(document).*_member).emplace_back();
    }
};

using block_list_map_t = std::map<std::string, std::unique_ptr<block_list_base>, case_insensitive_less>;

class document_schema_t
{
    block_schema_t _globals;
    block_list_map_t _blocks;

public:
    inline block_schema_t &globals() { return _globals; }
    inline const block_schema_t &globals() const { return _globals; }

    // throws if `tag` is already taken
    void add_block_list(std::string_view tag, std::unique_ptr<block_list_base> list);

    // nullptr if not declared
    const block_list_base *find_block_list(std::string_view tag) const;

    inline const block_list_map_t &block_lists() const { return _blocks; }
};

/**
 * Handed to a block type's `describe`. Block types only have scalar
 * fields; there's no nesting of block lists.
 *
 *   template<typename Builder>
 *   static void describe(Builder &b)
 *   {
 *       b.field("x", &vertex_t::x).field("y", &vertex_t::y);
 *   }
 */
template<typename B>
class block_schema_builder
{
    static_assert(std::is_base_of_v<block_t, B>, "block types derive from udmf::block_t");

    block_schema_t &_schema;

public:
    explicit block_schema_builder(block_schema_t &schema)
        : _schema(schema)
    {
    }

    // `Base` may be B or one of its bases, for types extending another standard
    template<typename Base, typename F>
    block_schema_builder &field(std::string_view name, F Base::*member)
    {
        static_assert(std::is_base_of_v<Base, B>);
        _schema.add_field(name, std::make_unique<member_field<B, F>>(static_cast<F B::*>(member)));
        return *this;
    }
};

template<typename D>
class document_schema_builder
{
    static_assert(std::is_base_of_v<document_t, D>, "document types derive from udmf::document_t");

    document_schema_t &_schema;

public:
    explicit document_schema_builder(document_schema_t &schema)
        : _schema(schema)
    {
    }

    template<typename Base, typename F>
    document_schema_builder &field(std::string_view name, F Base::*member)
    {
        static_assert(std::is_base_of_v<Base, D>);
        _schema.globals().add_field(name, std::make_unique<member_field<D, F>>(static_cast<F D::*>(member)));
        return *this;
    }

    template<typename Base, typename B>
    document_schema_builder &blocks(std::string_view tag, std::vector<B> Base::*member)
    {
        static_assert(std::is_base_of_v<Base, D>);

        auto list = std::make_unique<member_block_list<D, B>>(static_cast<std::vector<B> D::*>(member));
        block_schema_builder<B> builder(list->schema());
        B::describe(builder);

        _schema.add_block_list(tag, std::move(list));
        return *this;
    }
};

/**
 * Built schemas, one per document type. A schema is built the first time
 * it's asked for and kept for the life of the cache; concurrent first
 * requests for the same type all get the one instance.
 */
class schema_cache_t
{
    mutable std::mutex _lock;
    std::unordered_map<std::type_index, std::unique_ptr<const document_schema_t>> _schemas;

public:
    schema_cache_t() = default;
    schema_cache_t(const schema_cache_t &) = delete;
    schema_cache_t &operator=(const schema_cache_t &) = delete;

    template<typename D>
    const document_schema_t &get()
    {
        static_assert(std::is_base_of_v<document_t, D>, "document types derive from udmf::document_t");

        std::lock_guard lock(_lock);

        auto &entry = _schemas[std::type_index(typeid(D))];

        if (!entry) {
            auto schema = std::make_unique<document_schema_t>();
            document_schema_builder<D> builder(*schema);
            D::describe(builder);
            entry = std::move(schema);
        }

        return *entry;
    }

    // number of document types built so far
    size_t size() const;

    static schema_cache_t &global();
};
} // namespace udmf
