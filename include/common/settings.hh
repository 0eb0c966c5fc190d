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

#pragma once

#include <common/log.hh>
#include <common/parser.hh>
#include <common/cmdlib.hh>

#include <algorithm>
#include <vector>
#include <string>
#include <map>
#include <set>
#include <limits>
#include <optional>
#include <functional>

namespace settings
{
struct parse_exception : public std::exception
{
private:
    std::string _what;

public:
    parse_exception(std::string str);
    const char *what() const noexcept override;
};

// thrown after displaying `--help` text.
// the command-line tool catches this and exits with status 0.
// tests should let the test framework catch this and fail.
struct quit_after_help_exception : public std::exception
{
};

enum class source
{
    DEFAULT,
    COMMANDLINE
};

class nameset : public std::vector<std::string>
{
public:
    nameset(const char *str);
    nameset(const std::initializer_list<const char *> &strs);
};

struct setting_group
{
    const char *name;
    const int32_t order;
};

class setting_container;

// base class for any setting
class setting_base
{
protected:
    source _source = source::DEFAULT;
    nameset _names;
    const setting_group *_group;
    const char *_description;

    setting_base(
        setting_container *dictionary, const nameset &names, const setting_group *group, const char *description);

    bool change_source(source new_source);

public:
    virtual ~setting_base() = default;

    // not copyable; settings register their own address with
    // the container that owns them.
    setting_base(const setting_base &other) = delete;
    setting_base &operator=(const setting_base &other) = delete;

    inline const std::string &primary_name() const { return _names.at(0); }
    inline const nameset &names() const { return _names; }
    inline const setting_group *group() const { return _group; }
    inline const char *description() const { return _description; }

    constexpr bool is_changed() const { return _source != source::DEFAULT; }
    constexpr source get_source() const { return _source; }

    const char *sourceString() const;

    // resets value to default, and source to source::DEFAULT
    virtual void reset() = 0;
    virtual bool parse(const std::string &setting_name, parser_base_t &parser, source source) = 0;
    virtual std::string string_value() const = 0;
    virtual std::string format() const = 0;
};

// base class for a setting that has its own value
template<typename T>
class setting_value : public setting_base
{
protected:
    T _default;
    T _value;

public:
    inline setting_value(setting_container *dictionary, const nameset &names, T v, const setting_group *group = nullptr,
        const char *description = "")
        : setting_base(dictionary, names, group, description),
          _default(v),
          _value(v)
    {
    }

    const T &value() const { return _value; }

    virtual void set_value(const T &value, source new_source)
    {
        if (change_source(new_source)) {
            _value = value;
        }
    }

    inline void reset() override
    {
        _value = _default;
        _source = source::DEFAULT;
    }
};

class setting_bool : public setting_value<bool>
{
protected:
    bool parseInternal(parser_base_t &parser, source source, bool truthValue);

public:
    setting_bool(setting_container *dictionary, const nameset &names, bool v, const setting_group *group = nullptr,
        const char *description = "");

    bool parse(const std::string &setting_name, parser_base_t &parser, source source) override;
    std::string string_value() const override;
    std::string format() const override;
};

// an extension to setting_bool; this automatically adds "no" versions
// to the list, and will allow them to be used to act as `-name 0`.
class setting_invertible_bool : public setting_bool
{
public:
    setting_invertible_bool(setting_container *dictionary, const nameset &names, bool v,
        const setting_group *group = nullptr, const char *description = "");

    bool parse(const std::string &setting_name, parser_base_t &parser, source source) override;
};

// forwards a parse to several other settings, e.g. -quiet
class setting_redirect : public setting_base
{
private:
    std::vector<setting_base *> _settings;

public:
    setting_redirect(setting_container *dictionary, const nameset &names,
        const std::initializer_list<setting_base *> &settings, const setting_group *group = nullptr,
        const char *description = "");
    void reset() override;
    bool parse(const std::string &setting_name, parser_base_t &parser, source source) override;
    std::string string_value() const override;
    std::string format() const override;
};

template<typename T>
class setting_numeric : public setting_value<T>
{
    static_assert(!std::is_enum_v<T>, "use setting_enum for enums");

protected:
    T _min, _max;

public:
    inline setting_numeric(setting_container *dictionary, const nameset &names, T v, T minval, T maxval,
        const setting_group *group = nullptr, const char *description = "")
        : setting_value<T>(dictionary, names, v, group, description),
          _min(minval),
          _max(maxval)
    {
        // check the default value is valid
        Q_assert(_min < _max);
        Q_assert(this->_value >= _min);
        Q_assert(this->_value <= _max);
    }

    inline setting_numeric(setting_container *dictionary, const nameset &names, T v,
        const setting_group *group = nullptr, const char *description = "")
        : setting_numeric(
              dictionary, names, v, std::numeric_limits<T>::lowest(), std::numeric_limits<T>::max(), group, description)
    {
    }

    void set_value(const T &f, source new_source) override
    {
        if (f < _min) {
            logging::print("WARNING: '{}': {} is less than minimum value {}.\n", this->primary_name(), f, _min);
        }
        if (f > _max) {
            logging::print("WARNING: '{}': {} is greater than maximum value {}.\n", this->primary_name(), f, _max);
        }

        this->setting_value<T>::set_value(std::clamp(f, _min, _max), new_source);
    }

    bool parse(const std::string &setting_name, parser_base_t &parser, source source) override
    {
        if (!parser.parse_token()) {
            return false;
        }

        try {
            T f;

            if constexpr (std::is_floating_point_v<T>) {
                f = std::stod(parser.token);
            } else if constexpr (std::is_signed_v<T>) {
                f = static_cast<T>(std::stoll(parser.token));
            } else {
                f = static_cast<T>(std::stoull(parser.token));
            }

            this->set_value(f, source);

            return true;
        } catch (std::exception &) {
            return false;
        }
    }

    std::string string_value() const override { return std::to_string(this->_value); }

    std::string format() const override { return "n"; }
};

using setting_int32 = setting_numeric<int32_t>;

template<typename T>
class setting_enum : public setting_value<T>
{
private:
    std::map<std::string, T, case_insensitive_less> _values;

public:
    inline setting_enum(setting_container *dictionary, const nameset &names, T v,
        const std::initializer_list<std::pair<const char *, T>> &enum_values, const setting_group *group = nullptr,
        const char *description = "")
        : setting_value<T>(dictionary, names, v, group, description),
          _values(enum_values.begin(), enum_values.end())
    {
    }

    std::string string_value() const override
    {
        for (auto &value : _values) {
            if (value.second == this->_value) {
                return value.first;
            }
        }

        FError("enum value not registered for '{}'", this->primary_name());
    }

    std::string format() const override
    {
        std::string f;

        for (auto &value : _values) {
            if (!f.empty()) {
                f += " | ";
            }

            f += value.first;
        }

        return f;
    }

    bool parse(const std::string &setting_name, parser_base_t &parser, source source) override
    {
        if (!parser.parse_token()) {
            return false;
        }

        if (auto it = _values.find(parser.token); it != _values.end()) {
            this->set_value(it->second, source);
            return true;
        }

        return false;
    }
};

class setting_path : public setting_value<fs::path>
{
public:
    setting_path(setting_container *dictionary, const nameset &names, fs::path v, const setting_group *group = nullptr,
        const char *description = "");
    bool parse(const std::string &setting_name, parser_base_t &parser, source source) override;
    std::string string_value() const override;
    std::string format() const override;
};

// settings dictionary
class setting_container
{
    struct less
    {
        constexpr bool operator()(const setting_group *a, const setting_group *b) const
        {
            int32_t a_order = a ? a->order : std::numeric_limits<int32_t>::min();
            int32_t b_order = b ? b->order : std::numeric_limits<int32_t>::min();

            return a_order < b_order;
        }
    };

    std::map<std::string, setting_base *> _settingsmap;
    std::set<setting_base *> _settings;
    std::map<const setting_group *, std::vector<setting_base *>, less> _grouped_settings;

public:
    std::string program_name;
    std::string remainder_name = "filename";
    std::string program_description;

    inline setting_container() { }

    virtual ~setting_container();

    // not copyable, see setting_base
    setting_container(const setting_container &other) = delete;
    setting_container &operator=(const setting_container &other) = delete;

    virtual void reset();

    void register_setting(setting_base *setting);
    setting_base *find_setting(const std::string &name) const;

    inline const auto &grouped() const { return _grouped_settings; }

    void print_help();
    void print_summary();

    /**
     * Parse options from the input parser. The parsing
     * process is fairly tolerant, and will only really
     * fail hard if absolutely necessary. The remainder
     * of the command line is returned (anything not
     * eaten by the options).
     */
    std::vector<std::string> parse(parser_base_t &parser);
};

// global groups
extern setting_group performance_group, logging_group;

class common_settings : public virtual setting_container
{
public:
    // global settings
    setting_int32 threads;

    setting_invertible_bool log;
    setting_path logfile;
    setting_bool verbose;
    setting_bool nopercent;
    setting_bool nostat;
    setting_bool noprogress;
    setting_bool nocolor;
    setting_redirect quiet;

    common_settings();

    virtual void set_parameters(int argc, const char **argv);

    // before the parsing routine; set up options, members, etc
    virtual void preinitialize(int argc, const char **argv);
    // do the actual parsing; the non-option remainder is kept
    virtual void initialize(int argc, const char **argv);
    // after parsing has concluded, handle the side effects
    virtual void postinitialize(int argc, const char **argv);

    // run all three steps
    void run(int argc, const char **argv);

    // whatever the command line had left after the options
    std::vector<std::string> remainder;
};
}; // namespace settings
