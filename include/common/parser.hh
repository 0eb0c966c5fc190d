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

/*
 * common/parser.hh
 *
 * Command-line tokenizer for the settings system. The map
 * formats have their own scanners under quakemap/ and udmf/.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

enum : int32_t
{
    PARSE_NORMAL = 0,
    PARSE_PEEK = 8 /* Don't change parser state */
};

using parseflags = int32_t;

template<typename... T>
constexpr auto untie(const std::tuple<T...> &tuple)
{
    return std::tuple<typename std::remove_reference<T>::type...>(tuple);
}

template<typename T>
using untied_t = decltype(untie(std::declval<T>()));

struct parser_base_t
{
    std::string token; // the last token parsed by parse_token
    std::string source_name; // where the tokens come from, for messages

    inline parser_base_t(std::string source)
        : source_name(std::move(source))
    {
    }

    virtual ~parser_base_t() = default;

    virtual bool parse_token(parseflags flags = PARSE_NORMAL) = 0;

    virtual bool at_end() const = 0;

    virtual void push_state() = 0;

    virtual void pop_state() = 0;
};

// a parser that works on a list of tokens
struct token_parser_t : parser_base_t
{
    std::vector<std::string_view> tokens;
    size_t cur = 0;

    token_parser_t(int argc, const char **args, std::string source);

    using state_type = decltype(std::tie(cur, token));

    state_type state();

    bool parse_token(parseflags flags = PARSE_NORMAL) override;
    bool at_end() const override;

private:
    std::vector<untied_t<state_type>> _states;

public:
    void push_state() override;
    void pop_state() override;
};
