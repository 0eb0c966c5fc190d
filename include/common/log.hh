/*  Copyright (C) 2000-2006  Kevin Shanahan

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
 * common/log.hh
 *
 * Logging selected output to a file as well as stdout,
 * plus the error/assert helpers shared by every module.
 */

#pragma once

#include <atomic>
#include <list>
#include <limits>
#include <stdexcept> // for std::runtime_error
#include <functional> // for std::function
#include <optional> // for std::optional
#include <string>
#include <fmt/core.h>
#include <common/bitflags.hh>
#include <common/fs.hh>
#include <common/cmdlib.hh>

// forward declaration
namespace settings
{
class common_settings;
}

namespace logging
{
enum class flag : uint8_t
{
    NONE = 0, // none of the below (still prints though)
    DEFAULT = nth_bit(0), // prints everywhere
    VERBOSE = nth_bit(1), // prints everywhere, if enabled
    PROGRESS = nth_bit(2), // prints only to stdout, if enabled
    PERCENT = nth_bit(3), // prints everywhere, if enabled
    STAT = nth_bit(4), // prints everywhere, if enabled
    CLOCK_ELAPSED = nth_bit(5), // overrides displayElapsed if disabled
    ALL = 0xFF
};

extern bitflags<flag> mask;
extern bool enable_color_codes;

// Windows: calls SetConsoleMode for ANSI escape sequence processing (so colors work)
void preinitialize();

// initialize logging subsystem
void init(std::optional<fs::path> filename, const settings::common_settings &settings);

// shutdown logging subsystem
void close();

// print to respective targets based on log flag
void print(flag logflag, const char *str);

// print to respective targets based on log flag
void vprint(flag logflag, fmt::string_view format, fmt::format_args args);

// print to default targets
void vprint(fmt::string_view format, fmt::format_args args);

// format print to specified targets
template<typename... T>
inline void print(flag type, fmt::format_string<T...> format, T &&...args)
{
    if (mask & type) {
        vprint(type, format, fmt::make_format_args(args...));
    }
}

// format print to default targets
template<typename... T>
inline void print(fmt::format_string<T...> format, T &&...args)
{
    vprint(flag::DEFAULT, format, fmt::make_format_args(args...));
}

// set print callback; used by tests to capture output
using print_callback_t = std::function<void(flag logflag, const char *str)>;

void set_print_callback(print_callback_t cb);

void header(const char *name);

#define funcprint(fmt, ...) print("{}: " fmt, __func__, ##__VA_ARGS__)

void assert_(bool success, const char *expr, const char *file, int line);

// Display a percent timer. Only one of these can be active at a
// time. Once `count` == `max`, the progress display "finishes" and
// prints the elapsed time.
// Prefer <common/parallel.hh>'s parallel_for_each over calling this by hand.
void percent(uint64_t count, uint64_t max, bool displayElapsed = true);

// base class intended to be inherited for stat trackers;
// they will automatically print the results at the end,
// in the order of registration.
struct stat_tracker_t
{
    struct stat
    {
        std::string name;
        bool show_even_if_zero;
        bool is_warning;
        std::atomic_size_t count = 0;

        inline stat(const std::string &name, bool show_even_if_zero, bool is_warning)
            : name(name),
              show_even_if_zero(show_even_if_zero),
              is_warning(is_warning)
        {
        }

        inline size_t operator++(int) noexcept { return count++; }
        inline size_t operator++() noexcept { return ++count; }
        inline size_t operator+=(size_t v) noexcept { return count += v; }
    };

    std::list<stat> stats;
    bool stats_printed = false;

    stat &register_stat(const std::string &name, bool show_even_if_zero = false, bool is_warning = false);
    static size_t number_of_digits(size_t n);
    size_t number_of_digit_padding();
    void print_stats();
    virtual ~stat_tracker_t();
};
}; // namespace logging

class mapscan_error : public std::runtime_error
{
public:
    mapscan_error(const char *what);
};

[[noreturn]] void exit_on_exception(const std::exception &e);

/**
 * Throws a mapscan_error
 *
 * Reserved for broken caller contracts; malformed input is
 * reported through the parsers' error lists instead.
 */
[[noreturn]] void Error(const char *error);
[[noreturn]] void VError(fmt::string_view format, fmt::format_args args);

template<typename... T>
[[noreturn]] inline void Error(fmt::format_string<T...> format, T &&...args)
{
    VError(format, fmt::make_format_args(args...));
}

#define FError(fmt, ...) Error("{}: " fmt, __func__, ##__VA_ARGS__)

/**
 * assertion macro that is used in all builds (debug/release)
 */
#define Q_stringify__(x) #x
#define Q_stringify(x) Q_stringify__(x)
#define Q_assert(x) logging::assert_((x), Q_stringify(x), __FILE__, __LINE__)
