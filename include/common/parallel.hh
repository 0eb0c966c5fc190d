/*  Copyright (C) 1996-1997  Id Software, Inc.
    Copyright (C) 2017 Eric Wasylishen

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

#include "common/log.hh"
#include <tbb/parallel_for.h>

#include <atomic>
#include <cstddef>

// parallel extensions to logging
namespace logging
{
// runs func(i) for i in [start, end) on the TBB pool, with a percent display
template<typename Body>
void parallel_for(size_t start, size_t end, const Body &func)
{
    auto length = end - start;
    std::atomic<uint64_t> progress = 0;

    tbb::parallel_for(start, end, [&](size_t i) {
        percent(progress++, length);
        func(i);
    });

    percent(length, length);
}

// index-aware for_each; func(element, index)
template<typename Container, typename Body>
void parallel_for_each(Container &container, const Body &func)
{
    parallel_for(0, std::size(container), [&](size_t i) { func(container[i], i); });
}
} // namespace logging
