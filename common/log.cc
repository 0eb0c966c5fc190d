/*  Copyright (C) 2000-2001  Kevin Shanahan

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
 * common/log.cc
 */

#include <cmath> // for log10
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <fmt/ostream.h>
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <string>

#include <common/log.hh>
#include <common/settings.hh>
#include <common/cmdlib.hh>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>

#ifdef min
#undef min
#endif
#ifdef max
#undef max
#endif
#endif

static std::ofstream logfile;

namespace logging
{
bitflags<flag> mask = bitflags<flag>(flag::ALL) & ~bitflags<flag>(flag::VERBOSE);
bool enable_color_codes = true;

void preinitialize()
{
#ifdef _WIN32
    // enable processing of ANSI escape sequences on Windows
    HANDLE hOutput = GetStdHandle(STD_OUTPUT_HANDLE);
    SetConsoleMode(hOutput, ENABLE_PROCESSED_OUTPUT | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
#endif
}

void init(std::optional<fs::path> filename, const settings::common_settings &settings)
{
    if (settings.logfile.is_changed()) {
        filename = settings.logfile.value();
    } else if (!settings.log.value()) {
        return;
    }

    if (!filename.has_value()) {
        return;
    }

    fs::path p = fs::absolute(filename.value());

    if (logfile) {
        logfile.close();
    }

    logfile.open(p, std::ios_base::trunc);

    if (logfile) {
        print(flag::PROGRESS, "logging to {}\n", p.string());
        fmt::print(logfile, "---- {} / mapscan {} ----\n", settings.program_name, MAPSCAN_VERSION);
    } else {
        print(flag::PROGRESS, "WARNING: can't log to {}\n", p.string());
    }
}

void close()
{
    if (logfile.is_open()) {
        fmt::print(logfile, "\n\n");
        logfile.close();
    }
}

static std::mutex print_mutex;
static print_callback_t active_print_callback;

void set_print_callback(print_callback_t cb)
{
    std::lock_guard lock(print_mutex);
    active_print_callback = std::move(cb);
}

void print(flag logflag, const char *str)
{
    if (!(mask & logflag)) {
        return;
    }

    fmt::text_style style;

    if (enable_color_codes) {
        if (string_icontains(str, "error")) {
            style = fmt::fg(fmt::color::red);
        } else if (string_icontains(str, "warning")) {
            style = fmt::fg(fmt::terminal_color::yellow);
        } else if (bitflags<flag>(logflag) & flag::PERCENT) {
            style = fmt::fg(fmt::terminal_color::bright_black);
        } else if (bitflags<flag>(logflag) & flag::STAT) {
            style = fmt::fg(fmt::terminal_color::cyan);
        }
    }

    std::lock_guard lock(print_mutex);

    if (active_print_callback) {
        active_print_callback(logflag, str);
    }

    if (logflag != flag::PERCENT) {
        // log file, if open
        if (logfile.is_open() && logflag != flag::PROGRESS) {
            logfile << str;
            logfile.flush();
        }
    }

    if (enable_color_codes) {
        // stdout (assume the terminal can render ANSI colors)
        fmt::print(style, "{}", str);
    } else {
        std::cout << str;
    }

    // for editors that capture our output
    fflush(stdout);
}

void vprint(flag logflag, fmt::string_view format, fmt::format_args args)
{
    print(logflag, fmt::vformat(format, args).c_str());
}

void vprint(fmt::string_view format, fmt::format_args args)
{
    vprint(flag::DEFAULT, format, args);
}

void header(const char *name)
{
    print(flag::PROGRESS, "---- {} ----\n", name);
}

void assert_(bool success, const char *expr, const char *file, int line)
{
    if (!success) {
        print("{}:{}: Q_assert({}) failed.\n", file, line, expr);
#ifdef _WIN32
        __debugbreak();
#endif
        exit(1);
    }
}

static time_point start_time;
static bool is_timing = false;
static uint32_t last_pct = std::numeric_limits<uint32_t>::max();
static std::atomic_bool locked = false;

void percent(uint64_t count, uint64_t max, bool displayElapsed)
{
    bool expected = false;

    if (!(logging::mask & flag::CLOCK_ELAPSED)) {
        displayElapsed = false;
    }

    if (count == max) {
        while (!locked.compare_exchange_weak(expected, true)) {
            expected = false; // wait until everybody else is done
        }
    } else {
        if (!locked.compare_exchange_weak(expected, true)) {
            return; // somebody else is doing this already
        }
    }

    // we got the lock

    if (!is_timing) {
        start_time = I_FloatTime();
        is_timing = true;
        last_pct = std::numeric_limits<uint32_t>::max();
    }

    if (count == max) {
        auto elapsed = I_FloatTime() - start_time;
        is_timing = false;
        if (displayElapsed) {
            print(flag::PERCENT, "[100%] time elapsed: {:%H:%M:%S}\n",
                std::chrono::duration_cast<std::chrono::duration<long long, std::milli>>(elapsed));
        }
    } else if (max) {
        uint32_t pct = static_cast<uint32_t>((static_cast<double>(count) / max) * 100);
        if (last_pct != pct) {
            print(flag::PERCENT, "[{:>3}%]  ...\r", pct);
            last_pct = pct;
        }
    }

    // unlock for next call
    locked = false;
}

// stat_tracker_t

stat_tracker_t::stat &stat_tracker_t::register_stat(const std::string &name, bool show_even_if_zero, bool is_warning)
{
    return stats.emplace_back(name, show_even_if_zero, is_warning);
}

size_t stat_tracker_t::number_of_digits(size_t n)
{
    return n ? ((size_t)log10(n) + 1) : 1;
}

size_t stat_tracker_t::number_of_digit_padding()
{
    size_t number_padding = 0;

    // calculate padding for number
    for (auto &stat : stats) {
        if (!stat.is_warning && (stat.show_even_if_zero || stat.count)) {
            number_padding = std::max(number_of_digits(stat.count.load()), number_padding);
        }
    }

    if (!number_padding) {
        return number_padding;
    }

    return number_padding + ((number_padding - 1) / 3);
}

void stat_tracker_t::print_stats()
{
    if (stats_printed) {
        return;
    }

    stats_printed = true;

    // keep the numbers away from the left side
    size_t number_padding = number_of_digit_padding() + 4;

    for (auto &stat : stats) {
        if (stat.show_even_if_zero || stat.count) {
            print(flag::STAT, "{}{:{}} {}\n", stat.is_warning ? "WARNING: " : "", fmt::group_digits(stat.count.load()),
                stat.is_warning ? 0 : number_padding, stat.name);
        }
    }
}

stat_tracker_t::~stat_tracker_t()
{
    print_stats();
}
}; // namespace logging

mapscan_error::mapscan_error(const char *what)
    : std::runtime_error(what)
{
}

[[noreturn]] void exit_on_exception(const std::exception &e)
{
    logging::print("************ ERROR ************\n{}\n", e.what());
    logging::close();
    exit(1);
}

/*
 * =================
 * Error
 * For broken caller contracts
 * =================
 */
[[noreturn]] void Error(const char *error)
{
    throw mapscan_error(error);
}

[[noreturn]] void VError(fmt::string_view format, fmt::format_args args)
{
    auto formatted = fmt::vformat(format, args);
    Error(formatted.c_str());
}
