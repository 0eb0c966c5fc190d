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

/*
 * common/pool.hh
 *
 * Reusable scratch buffers for the parsers: string accumulators and
 * per-block collections are rented for the duration of one parse or
 * one block and handed back, so repeated parses don't churn the heap.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

namespace pool
{
template<typename T>
class array_pool
{
    std::mutex _lock;
    std::vector<std::vector<T>> _free;
    size_t _max_retained;
    std::atomic_size_t _rented = 0;
    std::atomic_size_t _returned = 0;

public:
    explicit array_pool(size_t max_retained = 32)
        : _max_retained(max_retained)
    {
    }

    array_pool(const array_pool &) = delete;
    array_pool &operator=(const array_pool &) = delete;

    // the returned buffer has size() == min_length; its contents are
    // whatever the previous renter left behind.
    std::vector<T> rent(size_t min_length)
    {
        std::vector<T> buffer;

        {
            std::lock_guard lock(_lock);

            // smallest retained buffer that fits, else the most recently returned one
            auto best = _free.end();

            for (auto it = _free.begin(); it != _free.end(); ++it) {
                if (it->capacity() >= min_length && (best == _free.end() || it->capacity() < best->capacity())) {
                    best = it;
                }
            }

            if (best == _free.end() && !_free.empty()) {
                best = _free.end() - 1;
            }

            if (best != _free.end()) {
                buffer = std::move(*best);
                _free.erase(best);
            }
        }

        _rented++;
        buffer.resize(min_length);
        return buffer;
    }

    // `return` is taken
    void give_back(std::vector<T> &&buffer)
    {
        _returned++;

        std::lock_guard lock(_lock);

        if (_free.size() < _max_retained) {
            _free.push_back(std::move(buffer));
        }
    }

    // drop every retained buffer
    void clear()
    {
        std::lock_guard lock(_lock);
        _free.clear();
    }

    size_t rented() const { return _rented; }
    size_t returned() const { return _returned; }
    size_t outstanding() const { return _rented - _returned; }

    size_t retained()
    {
        std::lock_guard lock(_lock);
        return _free.size();
    }

    // process-wide pool for T
    static array_pool &shared()
    {
        static array_pool instance;
        return instance;
    }
};

// a rented buffer that goes back to its pool when the lease goes out of scope
template<typename T>
class lease
{
    array_pool<T> *_pool;
    std::vector<T> _buffer;

    void release()
    {
        if (_pool) {
            _pool->give_back(std::move(_buffer));
            _pool = nullptr;
        }
    }

public:
    lease(array_pool<T> &from, size_t min_length)
        : _pool(&from),
          _buffer(from.rent(min_length))
    {
    }

    explicit lease(size_t min_length = 0)
        : lease(array_pool<T>::shared(), min_length)
    {
    }

    lease(lease &&other) noexcept
        : _pool(std::exchange(other._pool, nullptr)),
          _buffer(std::move(other._buffer))
    {
    }

    lease &operator=(lease &&other) noexcept
    {
        if (this != &other) {
            release();
            _pool = std::exchange(other._pool, nullptr);
            _buffer = std::move(other._buffer);
        }

        return *this;
    }

    lease(const lease &) = delete;
    lease &operator=(const lease &) = delete;

    ~lease() { release(); }

    std::vector<T> &operator*() { return _buffer; }
    const std::vector<T> &operator*() const { return _buffer; }
    std::vector<T> *operator->() { return &_buffer; }
    const std::vector<T> *operator->() const { return &_buffer; }
};
} // namespace pool
