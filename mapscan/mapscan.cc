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

#include <mapscan/mapscan.hh>

#include <iterator>

#include <common/cmdlib.hh>
#include <common/log.hh>
#include <common/parallel.hh>
#include <quakemap/mapfile.hh>
#include <udmf/parser.hh>
#include <udmf/standard.hh>

#include <fmt/core.h>
#include <fmt/chrono.h>

namespace settings
{
setting_group mapscan_group{"Scanning", 100};

void mapscan_settings::initialize(int argc, const char **argv)
{
    try {
        token_parser_t p(argc - 1, argv + 1, "command line");
        remainder = parse(p);

        if (remainder.empty()) {
            print_help();
        }

        sources.clear();

        for (auto &name : remainder) {
            // a bare map name means the .map
            if (format.value() == map_format_t::quake) {
                sources.push_back(DefaultExtension(name, ".map"));
            } else {
                sources.emplace_back(name);
            }
        }
    } catch (parse_exception &ex) {
        logging::print("{}", ex.what());
        print_help();
    }
}

void mapscan_settings::reset()
{
    common_settings::reset();
    remainder.clear();
    sources.clear();
}
} // namespace settings

settings::mapscan_settings mapscan_options;

map_format_t detect_format(const fs::path &path)
{
    if (string_iequals(path.filename().string(), "TEXTMAP")) {
        return map_format_t::udmf;
    }

    const std::string ext = path.extension().string();

    if (string_iequals(ext, ".udmf") || string_iequals(ext, ".txt")) {
        return map_format_t::udmf;
    }

    return map_format_t::quake;
}

static void DumpQuakeMap(const quakemap::map_t &map, std::string &out)
{
    for (size_t i = 0; i < map.entities.size(); i++) {
        auto &entity = map.entities[i];

        fmt::format_to(std::back_inserter(out), "entity {} ({} brushes)\n", i, entity.brushes.size());

        for (auto &[key, value] : entity.epairs) {
            fmt::format_to(std::back_inserter(out), "    \"{}\" \"{}\"\n", key, value);
        }

        for (auto &brush : entity.brushes) {
            for (auto &plane : brush.planes) {
                if (plane.is_valve220) {
                    fmt::format_to(std::back_inserter(out), "    ({}) ({}) ({}) {} [{} {}] [{} {}] {} {}\n", plane.point1,
                        plane.point2, plane.point3, plane.texture, plane.axis1, plane.offsets[0], plane.axis2,
                        plane.offsets[1], plane.rotation, plane.scale);
                } else {
                    fmt::format_to(std::back_inserter(out), "    ({}) ({}) ({}) {} {} {} {}\n", plane.point1,
                        plane.point2, plane.point3, plane.texture, plane.offsets, plane.rotation, plane.scale);
                }
            }
        }
    }
}

static void DumpUnknowns(const udmf::unknown_assignments_t &unknowns, std::string_view indent, std::string &out)
{
    for (auto &[key, value] : unknowns) {
        fmt::format_to(std::back_inserter(out), "{}{} = {} ({})\n", indent, key, value, udmf::value_type_name(value.type()));
    }
}

template<typename D>
static void ScanUDMF(std::string_view source, bool dump, scan_result_t &result)
{
    udmf::parser_t parser;
    D data = parser.parse<D>(source);

    for (auto &error : parser.errors()) {
        result.errors.push_back({error.line, error.column, error.message});
    }

    result.blocks = data.vertices.size() + data.linedefs.size() + data.sidedefs.size() + data.sectors.size() +
                    data.things.size();

    for (auto &[tag, blocks] : data.unknown_blocks) {
        result.blocks += blocks.size();
    }

    if (!dump) {
        return;
    }

    auto &out = result.dump;
    fmt::format_to(std::back_inserter(out), "namespace \"{}\"\n", data.name_space);
    fmt::format_to(std::back_inserter(out), "{} vertices, {} linedefs, {} sidedefs, {} sectors, {} things\n",
        data.vertices.size(), data.linedefs.size(), data.sidedefs.size(), data.sectors.size(), data.things.size());

    DumpUnknowns(data.unknown_global_assignments, "", out);

    for (auto &[tag, blocks] : data.unknown_blocks) {
        for (auto &block : blocks) {
            fmt::format_to(std::back_inserter(out), "{}\n", tag);
            DumpUnknowns(block.unknown_assignments, "    ", out);
        }
    }
}

scan_result_t scan_source(std::string_view source, map_format_t format, udmf_schema_t schema, bool dump)
{
    scan_result_t result;
    result.format = format;

    if (format == map_format_t::quake) {
        quakemap::parser_t parser;
        auto map = parser.parse(source);

        for (auto &error : parser.errors()) {
            result.errors.push_back({error.line, error.column, error.message});
        }

        if (map) {
            result.entities = map->entities.size();
            result.brushes = map->total_brushes();
            result.planes = map->total_planes();

            if (dump) {
                DumpQuakeMap(*map, result.dump);
            }
        }
    } else if (format == map_format_t::udmf) {
        if (schema == udmf_schema_t::zdoom) {
            ScanUDMF<udmf::zdoom::map_data_t>(source, dump, result);
        } else {
            ScanUDMF<udmf::standard::map_data_t>(source, dump, result);
        }
    } else {
        FError("format must be resolved before scanning");
    }

    return result;
}

static scan_result_t ScanFile(const fs::path &path)
{
    map_format_t format = mapscan_options.format.value();

    if (format == map_format_t::automatic) {
        format = detect_format(path);
    }

    auto data = fs::load(path);

    if (!data) {
        scan_result_t result;
        result.path = path;
        result.format = format;
        result.unreadable = true;
        return result;
    }

    scan_result_t result =
        scan_source(fs::as_text(data), format, mapscan_options.udmf_schema.value(), mapscan_options.dump.value());
    result.path = path;
    return result;
}

struct scan_stats_t : logging::stat_tracker_t
{
    stat &files = register_stat("files scanned", true);
    stat &entities = register_stat("entities");
    stat &brushes = register_stat("brushes");
    stat &planes = register_stat("planes");
    stat &blocks = register_stat("UDMF blocks");
    stat &unreadable = register_stat("files couldn't be read", false, true);
    stat &errors = register_stat("parse errors", false, true);
};

static void ReportResult(const scan_result_t &result, scan_stats_t &stats)
{
    stats.files++;

    if (result.unreadable) {
        logging::print("{}: error: couldn't read file\n", result.path);
        stats.unreadable++;
        return;
    }

    for (auto &error : result.errors) {
        logging::print("{}:{}:{}: error: {}\n", result.path, error.line, error.column, error.message);
    }

    stats.errors += result.errors.size();
    stats.entities += result.entities;
    stats.brushes += result.brushes;
    stats.planes += result.planes;
    stats.blocks += result.blocks;

    if (!result.errors.empty()) {
        logging::print("{}: {} errors\n", result.path, result.errors.size());
    } else if (result.format == map_format_t::quake) {
        logging::print("{}: ok, {} entities, {} brushes, {} planes\n", result.path, result.entities, result.brushes,
            result.planes);
    } else {
        logging::print("{}: ok, {} blocks\n", result.path, result.blocks);
    }

    if (!result.dump.empty()) {
        logging::print("{}", result.dump);
    }
}

int mapscan_main(int argc, const char **argv)
{
    try {
        logging::preinitialize();

        mapscan_options.reset();
        mapscan_options.run(argc, argv);

        logging::init(fs::path("mapscan.log"), mapscan_options);

        auto start = I_FloatTime();

        std::vector<scan_result_t> results(mapscan_options.sources.size());

        logging::header("Scanning");

        logging::parallel_for_each(
            results, [](scan_result_t &result, size_t i) { result = ScanFile(mapscan_options.sources[i]); });

        bool all_ok = true;

        {
            scan_stats_t stats;

            for (auto &result : results) {
                ReportResult(result, stats);
                all_ok = all_ok && result.ok();
            }
        }

        logging::print(logging::flag::CLOCK_ELAPSED, "{:.3} elapsed\n", I_FloatTime() - start);
        logging::close();

        return all_ok ? 0 : 1;
    } catch (const settings::quit_after_help_exception &) {
        return 0;
    } catch (const std::exception &e) {
        exit_on_exception(e);
    }
}

int mapscan_main(const std::vector<std::string> &args)
{
    std::vector<const char *> argPtrs;
    for (const std::string &arg : args) {
        argPtrs.push_back(arg.data());
    }

    return mapscan_main(argPtrs.size(), argPtrs.data());
}
