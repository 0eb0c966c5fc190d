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

#include <common/parser.hh>
#include <common/log.hh>

// token_parser_t

token_parser_t::token_parser_t(int argc, const char **args, std::string source)
    : parser_base_t(std::move(source)),
      tokens(args, args + argc)
{
}

token_parser_t::state_type token_parser_t::state()
{
    return std::tie(cur, token);
}

bool token_parser_t::parse_token(parseflags flags)
{
    // peek doesn't advance
    if (at_end()) {
        return false;
    }

    token = tokens[cur];

    if (!(flags & PARSE_PEEK)) {
        cur++;
    }

    return true;
}

bool token_parser_t::at_end() const
{
    return cur >= tokens.size();
}

void token_parser_t::push_state()
{
    _states.push_back(state());
}

void token_parser_t::pop_state()
{
    Q_assert(!_states.empty());
    state() = _states.back();
    _states.pop_back();
}
