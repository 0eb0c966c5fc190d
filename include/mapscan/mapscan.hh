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

#include <string>
#include <vector>

#include <common/fs.hh>
#include <common/settings.hh>

enum class map_format_t
{
    automatic,
    quake,
    udmf
};

enum class udmf_schema_t
{
    standard,
    zdoom
};

namespace settings
{
extern setting_group mapscan_group;

class mapscan_settings : public common_settings
{
public:
    setting_enum<map_format_t> format{this, "format", map_format_t::automatic,
        {{"auto", map_format_t::automatic}, {"map", map_format_t::quake}, {"udmf", map_format_t::udmf}},
        &mapscan_group, "input format; auto picks it from the file name"};
    setting_enum<udmf_schema_t> udmf_schema{this, "udmf", udmf_schema_t::standard,
        {{"standard", udmf_schema_t::standard}, {"zdoom", udmf_schema_t::zdoom}}, &mapscan_group,
        "which namespace UDMF files are read as"};
    setting_bool dump{this, "dump", false, &mapscan_group, "print what was parsed out of each file"};

    std::vector<fs::path> sources;

    void set_parameters(int argc, const char **argv) override
    {
        common_settings::set_parameters(argc, argv);
        program_description = "mapscan checks Quake .map and UDMF TEXTMAP sources for syntax errors.\n\n";
        remainder_name = "file.map [file.udmf ...]";
    }
    void initialize(int argc, const char **argv) override;
    void reset() override;
};
} // namespace settings

extern settings::mapscan_settings mapscan_options;

struct scan_error_t
{
    size_t line = 0;
    size_t column = 0;
    std::string message;
};

// what came out of one source
struct scan_result_t
{
    fs::path path;
    map_format_t format = map_format_t::automatic;

    // couldn't be read at all
    bool unreadable = false;
    std::vector<scan_error_t> errors;

    size_t entities = 0;
    size_t brushes = 0;
    size_t planes = 0;
    size_t blocks = 0;

    // filled in with -dump
    std::string dump;

    inline bool ok() const { return !unreadable && errors.empty(); }
};

// .map is Quake; .udmf, .txt and anything named TEXTMAP is UDMF
map_format_t detect_format(const fs::path &path);

// `format` must not be automatic
scan_result_t scan_source(std::string_view source, map_format_t format, udmf_schema_t schema, bool dump);

int mapscan_main(int argc, const char **argv);
int mapscan_main(const std::vector<std::string> &args);
