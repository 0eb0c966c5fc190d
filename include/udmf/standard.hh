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

#include <cstdint>
#include <string>
#include <vector>

#include <udmf/schema.hh>
#include <udmf/value.hh>

// the base UDMF 1.1 namespaces, and the ZDoom extensions we read
namespace udmf::standard
{
struct vertex_t : block_t
{
    float x = 0, y = 0;

    template<typename Builder>
    static void describe(Builder &b)
    {
        b.field("x", &vertex_t::x).field("y", &vertex_t::y);
    }
};

struct linedef_t : block_t
{
    int32_t id = -1;
    int32_t v1 = 0, v2 = 0;

    // physics
    bool blocking = false;
    bool blockmonsters = false;
    bool blockfloaters = false;
    bool blocksound = false;
    bool jumpover = false;

    // texture
    bool twosided = false;
    bool dontpegtop = false;
    bool dontpegbottom = false;

    bool secret = false;
    bool dontdraw = false;
    bool mapped = false;
    bool passuse = false;
    bool translucent = false;

    // activation
    bool playercross = false;
    bool playeruse = false;
    bool monstercross = false;
    bool monsteruse = false;
    bool impact = false;
    bool playerpush = false;
    bool monsterpush = false;
    bool missilecross = false;
    bool repeatspecial = false;

    int32_t special = 0;
    int32_t arg0 = 0, arg1 = 0, arg2 = 0, arg3 = 0, arg4 = 0;

    int32_t sidefront = 0;
    int32_t sideback = -1;

    std::string comment;

    template<typename Builder>
    static void describe(Builder &b)
    {
        b.field("id", &linedef_t::id).field("v1", &linedef_t::v1).field("v2", &linedef_t::v2);

        b.field("blocking", &linedef_t::blocking)
            .field("blockmonsters", &linedef_t::blockmonsters)
            .field("blockfloaters", &linedef_t::blockfloaters)
            .field("blocksound", &linedef_t::blocksound)
            .field("jumpover", &linedef_t::jumpover);

        b.field("twosided", &linedef_t::twosided)
            .field("dontpegtop", &linedef_t::dontpegtop)
            .field("dontpegbottom", &linedef_t::dontpegbottom)
            .field("secret", &linedef_t::secret)
            .field("dontdraw", &linedef_t::dontdraw)
            .field("mapped", &linedef_t::mapped)
            .field("passuse", &linedef_t::passuse)
            .field("translucent", &linedef_t::translucent);

        b.field("playercross", &linedef_t::playercross)
            .field("playeruse", &linedef_t::playeruse)
            .field("monstercross", &linedef_t::monstercross)
            .field("monsteruse", &linedef_t::monsteruse)
            .field("impact", &linedef_t::impact)
            .field("playerpush", &linedef_t::playerpush)
            .field("monsterpush", &linedef_t::monsterpush)
            .field("missilecross", &linedef_t::missilecross)
            .field("repeatspecial", &linedef_t::repeatspecial);

        b.field("special", &linedef_t::special)
            .field("arg0", &linedef_t::arg0)
            .field("arg1", &linedef_t::arg1)
            .field("arg2", &linedef_t::arg2)
            .field("arg3", &linedef_t::arg3)
            .field("arg4", &linedef_t::arg4);

        b.field("sidefront", &linedef_t::sidefront)
            .field("sideback", &linedef_t::sideback)
            .field("comment", &linedef_t::comment);
    }
};

struct sidedef_t : block_t
{
    float offsetx = 0, offsety = 0;

    std::string texturetop = "-";
    std::string texturemiddle = "-";
    std::string texturebottom = "-";

    int32_t sector = 0;

    std::string comment;

    template<typename Builder>
    static void describe(Builder &b)
    {
        b.field("offsetx", &sidedef_t::offsetx)
            .field("offsety", &sidedef_t::offsety)
            .field("texturetop", &sidedef_t::texturetop)
            .field("texturemiddle", &sidedef_t::texturemiddle)
            .field("texturebottom", &sidedef_t::texturebottom)
            .field("sector", &sidedef_t::sector)
            .field("comment", &sidedef_t::comment);
    }
};

struct sector_t : block_t
{
    float heightfloor = 0, heightceiling = 0;

    std::string texturefloor;
    std::string textureceiling;

    int32_t lightlevel = 160;
    int32_t special = 0;
    int32_t id = 0;

    std::string comment;

    template<typename Builder>
    static void describe(Builder &b)
    {
        b.field("heightfloor", &sector_t::heightfloor)
            .field("heightceiling", &sector_t::heightceiling)
            .field("texturefloor", &sector_t::texturefloor)
            .field("textureceiling", &sector_t::textureceiling)
            .field("lightlevel", &sector_t::lightlevel)
            .field("special", &sector_t::special)
            .field("id", &sector_t::id)
            .field("comment", &sector_t::comment);
    }
};

struct thing_t : block_t
{
    int32_t id = 0;

    float x = 0, y = 0;
    float height = 0;

    int32_t angle = 0;
    int32_t type = 0;

    // spawn flags
    bool skill1 = false, skill2 = false, skill3 = false, skill4 = false, skill5 = false;
    bool single = false;
    bool dm = false;
    bool coop = false;
    bool class1 = false, class2 = false, class3 = false;

    // monster behaviour
    bool dormant = false;
    bool ambush = false;
    bool standing = false;
    bool friend_ = false;
    bool strifeally = false;

    bool translucent = false;
    bool invisible = false;

    int32_t special = 0;
    int32_t arg0 = 0, arg1 = 0, arg2 = 0, arg3 = 0, arg4 = 0;

    std::string comment;

    template<typename Builder>
    static void describe(Builder &b)
    {
        b.field("id", &thing_t::id)
            .field("x", &thing_t::x)
            .field("y", &thing_t::y)
            .field("height", &thing_t::height)
            .field("angle", &thing_t::angle)
            .field("type", &thing_t::type);

        b.field("skill1", &thing_t::skill1)
            .field("skill2", &thing_t::skill2)
            .field("skill3", &thing_t::skill3)
            .field("skill4", &thing_t::skill4)
            .field("skill5", &thing_t::skill5)
            .field("single", &thing_t::single)
            .field("dm", &thing_t::dm)
            .field("coop", &thing_t::coop)
            .field("class1", &thing_t::class1)
            .field("class2", &thing_t::class2)
            .field("class3", &thing_t::class3);

        b.field("dormant", &thing_t::dormant)
            .field("ambush", &thing_t::ambush)
            .field("standing", &thing_t::standing)
            .field("friend", &thing_t::friend_)
            .field("strifeally", &thing_t::strifeally)
            .field("translucent", &thing_t::translucent)
            .field("invisible", &thing_t::invisible);

        b.field("special", &thing_t::special)
            .field("arg0", &thing_t::arg0)
            .field("arg1", &thing_t::arg1)
            .field("arg2", &thing_t::arg2)
            .field("arg3", &thing_t::arg3)
            .field("arg4", &thing_t::arg4)
            .field("comment", &thing_t::comment);
    }
};

// a whole TEXTMAP lump
template<typename Vertex, typename Linedef, typename Sidedef, typename Sector, typename Thing>
struct basic_map_data_t : document_t
{
    // `namespace = "...";`
    std::string name_space;

    std::vector<Vertex> vertices;
    std::vector<Linedef> linedefs;
    std::vector<Sidedef> sidedefs;
    std::vector<Sector> sectors;
    std::vector<Thing> things;

    template<typename Builder>
    static void describe(Builder &b)
    {
        b.field("namespace", &basic_map_data_t::name_space)
            .blocks("vertex", &basic_map_data_t::vertices)
            .blocks("linedef", &basic_map_data_t::linedefs)
            .blocks("sidedef", &basic_map_data_t::sidedefs)
            .blocks("sector", &basic_map_data_t::sectors)
            .blocks("thing", &basic_map_data_t::things);
    }
};

struct map_data_t : basic_map_data_t<vertex_t, linedef_t, sidedef_t, sector_t, thing_t>
{
};
} // namespace udmf::standard

namespace udmf::zdoom
{
struct vertex_t : standard::vertex_t
{
    float zfloor = 0, zceiling = 0;

    template<typename Builder>
    static void describe(Builder &b)
    {
        standard::vertex_t::describe(b);
        b.field("zfloor", &vertex_t::zfloor).field("zceiling", &vertex_t::zceiling);
    }
};

using linedef_t = standard::linedef_t;
using sidedef_t = standard::sidedef_t;
using sector_t = standard::sector_t;
using thing_t = standard::thing_t;

struct map_data_t : standard::basic_map_data_t<vertex_t, linedef_t, sidedef_t, sector_t, thing_t>
{
};
} // namespace udmf::zdoom
