/*  Copyright (C) 2016 Eric Wasylishen

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

#include "common/settings.hh"
#include "common/threads.hh"
#include "common/fs.hh"
#include <common/log.hh>

namespace settings
{
// parse_exception
parse_exception::parse_exception(std::string str)
    : _what(std::move(str))
{
}

const char *parse_exception::what() const noexcept
{
    return _what.c_str();
}

// nameset

nameset::nameset(const char *str)
    : vector<std::string>({str})
{
}
nameset::nameset(const std::initializer_list<const char *> &strs)
    : vector(strs.begin(), strs.end())
{
}

// setting_base

setting_base::setting_base(
    setting_container *dictionary, const nameset &names, const setting_group *group, const char *description)
    : _names(names),
      _group(group),
      _description(description)
{
    Q_assert(_names.size() > 0);

    if (dictionary) {
        dictionary->register_setting(this);
    }
}

bool setting_base::change_source(source new_source)
{
    if (new_source >= _source) {
        _source = new_source;
        return true;
    }
    return false;
}

const char *setting_base::sourceString() const
{
    switch (_source) {
        case source::DEFAULT: return "default";
        case source::COMMANDLINE: return "command line";
        default: FError("Error: unknown setting source");
    }
}

// setting_bool

bool setting_bool::parseInternal(parser_base_t &parser, source source, bool truthValue)
{
    // boolean flags can be just flagged themselves
    if (parser.parse_token(PARSE_PEEK)) {
        // if the token that follows is 1, 0 or -1, we'll handle it
        // as a value, otherwise it's probably part of the next option.
        if (parser.token == "1" || parser.token == "0" || parser.token == "-1") {
            parser.parse_token();

            int intval = std::stoi(parser.token);

            const bool f = (intval != 0 && intval != -1) ? truthValue : !truthValue; // treat 0 and -1 as false

            set_value(f, source);

            return true;
        }
    }

    set_value(truthValue, source);

    return true;
}

setting_bool::setting_bool(
    setting_container *dictionary, const nameset &names, bool v, const setting_group *group, const char *description)
    : setting_value(dictionary, names, v, group, description)
{
}

bool setting_bool::parse(const std::string &setting_name, parser_base_t &parser, source source)
{
    return parseInternal(parser, source, true);
}

std::string setting_bool::string_value() const
{
    return _value ? "1" : "0";
}

std::string setting_bool::format() const
{
    return _default ? "[0]" : "";
}

// setting_invertible_bool

static nameset extendNames(const nameset &names)
{
    nameset n = names;

    for (auto &name : names) {
        n.push_back("no" + name);
    }

    return n;
}

setting_invertible_bool::setting_invertible_bool(
    setting_container *dictionary, const nameset &names, bool v, const setting_group *group, const char *description)
    : setting_bool(dictionary, extendNames(names), v, group, description)
{
}

bool setting_invertible_bool::parse(const std::string &setting_name, parser_base_t &parser, source source)
{
    return parseInternal(parser, source, setting_name.compare(0, 2, "no") != 0);
}

// setting_redirect

setting_redirect::setting_redirect(setting_container *dictionary, const nameset &names,
    const std::initializer_list<setting_base *> &settings, const setting_group *group, const char *description)
    : setting_base(dictionary, names, group, description),
      _settings(settings)
{
}

void setting_redirect::reset() { }

bool setting_redirect::parse(const std::string &setting_name, parser_base_t &parser, source source)
{
    // run the parse function for every setting that we redirect
    // to; for every entry except the last, backup & restore the state.
    for (size_t i = 0; i < _settings.size(); i++) {
        if (i != _settings.size() - 1) {
            parser.push_state();
        }

        if (!_settings[i]->parse(setting_name, parser, source)) {
            return false;
        }

        if (i != _settings.size() - 1) {
            parser.pop_state();
        }
    }

    return true;
}

std::string setting_redirect::string_value() const
{
    return _settings[0]->string_value();
}

std::string setting_redirect::format() const
{
    return _settings[0]->format();
}

// setting_group

setting_group performance_group{"Performance", 10};
setting_group logging_group{"Logging", 5};

// setting_path

setting_path::setting_path(setting_container *dictionary, const nameset &names, fs::path v, const setting_group *group,
    const char *description)
    : setting_value(dictionary, names, v, group, description)
{
}

bool setting_path::parse(const std::string &setting_name, parser_base_t &parser, source source)
{
    // make sure we can parse token out
    if (!parser.parse_token()) {
        return false;
    }

    set_value(parser.token, source);
    return true;
}

std::string setting_path::string_value() const
{
    return _value.string();
}

std::string setting_path::format() const
{
    return "\"relative/path\" or \"/absolute/path\"";
}

// setting_container

setting_container::~setting_container() = default;

void setting_container::reset()
{
    for (auto setting : _settings) {
        setting->reset();
    }
}

void setting_container::register_setting(setting_base *setting)
{
    for (const auto &name : setting->names()) {
        Q_assert(_settingsmap.find(name) == _settingsmap.end());
        _settingsmap.emplace(name, setting);
    }

    _settings.emplace(setting);
    _grouped_settings[setting->group()].push_back(setting);
}

setting_base *setting_container::find_setting(const std::string &name) const
{
    if (auto it = _settingsmap.find(name); it != _settingsmap.end()) {
        return it->second;
    }

    return nullptr;
}

void setting_container::print_help()
{
    fmt::print("{}usage: {} [-help/-h/-?] [-options] {}\n\n", program_description, program_name, remainder_name);

    for (auto &grouped : grouped()) {
        if (grouped.first) {
            fmt::print("{}:\n", grouped.first->name);
        }

        for (auto setting : grouped.second) {
            // long names just run into the format column
            const size_t nameWidth = setting->primary_name().size() + 4;
            const size_t numPadding = nameWidth < 28 ? 28 - nameWidth : 0;
            fmt::print(
                "  -{} {:{}}    {}\n", setting->primary_name(), setting->format(), numPadding, setting->description());

            for (size_t i = 1; i < setting->names().size(); i++) {
                fmt::print("   \\{}\n", setting->names()[i]);
            }
        }

        fmt::print("\n");
    }

    throw quit_after_help_exception();
}

void setting_container::print_summary()
{
    bool any_changed = false;

    for (auto setting : _settings) {
        if (setting->is_changed()) {
            any_changed = true;
            break;
        }
    }

    if (!any_changed) {
        return;
    }

    logging::print(logging::flag::VERBOSE, "\n--- Options Summary ---\n");
    for (auto setting : _settings) {
        if (setting->is_changed()) {
            logging::print(logging::flag::VERBOSE, "    \"{}\" was set to \"{}\" (from {})\n",
                setting->primary_name(), setting->string_value(), setting->sourceString());
        }
    }
    logging::print(logging::flag::VERBOSE, "\n");
}

std::vector<std::string> setting_container::parse(parser_base_t &parser)
{
    // the settings parser loop will continuously eat tokens as long as
    // it begins with a -; once we have no more settings to consume, we
    // break out of this loop and return the remainder.
    while (true) {
        // end of cmd line
        if (!parser.parse_token(PARSE_PEEK)) {
            break;
        }

        // end of options
        if (parser.token.empty() || parser.token[0] != '-') {
            break;
        }

        // actually eat the token since we peeked above
        parser.parse_token();

        // remove leading hyphens. we support any number of them.
        while (!parser.token.empty() && parser.token.front() == '-') {
            parser.token.erase(parser.token.begin());
        }

        if (parser.token.empty()) {
            throw parse_exception("stray \"-\" in command line; please check your parameters");
        }

        if (parser.token == "help" || parser.token == "h" || parser.token == "?") {
            print_help();
        }

        auto setting = find_setting(parser.token);

        if (!setting) {
            throw parse_exception(fmt::format("unknown option \"{}\"", parser.token));
        }

        // pass off to setting to parse; store
        // name for error message below
        std::string token = std::move(parser.token);

        if (!setting->parse(token, parser, source::COMMANDLINE)) {
            throw parse_exception(
                fmt::format("invalid value for option \"{}\"; should be in format {}", token, setting->format()));
        }
    }

    // return remainder
    std::vector<std::string> remainder;

    while (true) {
        if (parser.at_end() || !parser.parse_token()) {
            break;
        }

        remainder.emplace_back(std::move(parser.token));
    }

    return remainder;
}

// global settings
common_settings::common_settings()
    : threads{this, "threads", 0, &performance_group, "number of threads to use, maximum; leave 0 for automatic"},
      log{this, "log", false, &logging_group, "whether a log file is written or not"},
      logfile{this, "logfile", "", &logging_group, "write the log to this file (implies -log)"},
      verbose{this, {"verbose", "v"}, false, &logging_group, "verbose output"},
      nopercent{this, "nopercent", false, &logging_group, "don't output percentage messages"},
      nostat{this, "nostat", false, &logging_group, "don't output statistic messages"},
      noprogress{this, "noprogress", false, &logging_group, "don't output progress messages"},
      nocolor{this, "nocolor", false, &logging_group, "don't output color codes (for editors, etc)"},
      quiet{this, {"quiet", "noverbose"}, {&nopercent, &nostat, &noprogress}, &logging_group,
          "suppress non-important messages (equivalent to -nopercent -nostat -noprogress)"}
{
}

void common_settings::set_parameters(int argc, const char **argv)
{
    program_name = fs::path(argv[0]).stem().string();
}

void common_settings::preinitialize(int argc, const char **argv)
{
    set_parameters(argc, argv);
}

void common_settings::initialize(int argc, const char **argv)
{
    token_parser_t p(argc - 1, argv + 1, "command line");
    remainder = parse(p);
}

void common_settings::postinitialize(int argc, const char **argv)
{
    if (verbose.value()) {
        logging::mask |= logging::flag::VERBOSE;
    }

    if (nopercent.value()) {
        logging::mask &= ~(bitflags<logging::flag>(logging::flag::PERCENT) | logging::flag::CLOCK_ELAPSED);
    }

    if (nostat.value()) {
        logging::mask &= ~bitflags<logging::flag>(logging::flag::STAT);
    }

    if (noprogress.value()) {
        logging::mask &= ~bitflags<logging::flag>(logging::flag::PROGRESS);
    }

    if (nocolor.value()) {
        logging::enable_color_codes = false;
    }

    print_summary();

    configureTBB(threads.value());
}

void common_settings::run(int argc, const char **argv)
{
    preinitialize(argc, argv);
    initialize(argc, argv);
    postinitialize(argc, argv);
}
} // namespace settings
