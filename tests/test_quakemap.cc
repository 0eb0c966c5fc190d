#include <gtest/gtest.h>

#include <common/fs.hh>
#include <common/pool.hh>
#include <quakemap/mapfile.hh>

#include "test_main.hh"
#include "testmaps.hh"

static const char *legacy_cube = R"(
// Game: Quake
// Format: Standard
// entity 0
{
"classname" "worldspawn"
// brush 0
{
( -16 -64 -16 ) ( -16 -63 -16 ) ( -16 -64 -15 ) __TB_empty -0 -0 -0 1 1
( -64 -16 -16 ) ( -64 -16 -15 ) ( -63 -16 -16 ) __TB_empty -0 -0 -0 1 1
( -64 -64 -16 ) ( -63 -64 -16 ) ( -64 -63 -16 ) __TB_empty 0 0 0 1 1
( 64 64 16 ) ( 64 65 16 ) ( 65 64 16 ) __TB_empty 0 0 0 1 1
( 64 16 16 ) ( 65 16 16 ) ( 64 16 17 ) __TB_empty -0 -0 -0 1 1
( 16 64 16 ) ( 16 64 17 ) ( 16 65 16 ) __TB_empty -0 -0 -0 1 1
}
}
)";

static const char *valve_cube = R"(
// Game: Quake
// Format: Valve
// entity 0
{
"classname" "worldspawn"
"mapversion" "220"
// brush 0
{
( -16 -64 -16 ) ( -16 -63 -16 ) ( -16 -64 -15 ) __TB_empty [ 0 -1 0 -0 ] [ 0 0 -1 -0 ] -0 1 1
( -64 -16 -16 ) ( -64 -16 -15 ) ( -63 -16 -16 ) __TB_empty [ 1 0 0 -0 ] [ 0 0 -1 -0 ] -0 1 1
( -64 -64 -16 ) ( -63 -64 -16 ) ( -64 -63 -16 ) __TB_empty [ -1 0 0 0 ] [ 0 -1 0 0 ] 0 1 1
( 64 64 16 ) ( 64 65 16 ) ( 65 64 16 ) __TB_empty [ 1 0 0 0 ] [ 0 -1 0 0 ] 0 1 1
( 64 16 16 ) ( 65 16 16 ) ( 64 16 17 ) __TB_empty [ -1 0 0 -0 ] [ 0 0 -1 -0 ] -0 1 1
( 16 64 16 ) ( 16 64 17 ) ( 16 65 16 ) __TB_empty [ 0 1 0 -0 ] [ 0 0 -1 -0 ] 45 0.5 2
}
}
)";

static quakemap::map_t LoadMapOrFail(std::string_view source)
{
    auto result = quakemap::parse(source);

    for (auto &error : result.errors) {
        ADD_FAILURE() << fmt::format("{}", error);
    }

    if (!result.map) {
        ADD_FAILURE() << "no map returned";
        return {};
    }

    return std::move(*result.map);
}

TEST(quakemap, scannerTokenKinds)
{
    quakemap::scanner_t scanner(R"({ } ( ) [ ] "a b" 12 -3.5 1e3 *water1 +0button 128x // comment
# )");

    auto expect = [&](quakemap::token_type_t type, std::string_view text) {
        auto token = scanner.read();
        EXPECT_EQ(type, token.type) << text;
        EXPECT_EQ(text, token.text);
    };

    expect(quakemap::token_type_t::brace_open, "{");
    expect(quakemap::token_type_t::brace_close, "}");
    expect(quakemap::token_type_t::parens_open, "(");
    expect(quakemap::token_type_t::parens_close, ")");
    expect(quakemap::token_type_t::bracket_open, "[");
    expect(quakemap::token_type_t::bracket_close, "]");
    expect(quakemap::token_type_t::quoted_string, "a b");
    expect(quakemap::token_type_t::integer, "12");
    expect(quakemap::token_type_t::floating, "-3.5");
    expect(quakemap::token_type_t::floating, "1e3");
    expect(quakemap::token_type_t::text, "*water1");
    expect(quakemap::token_type_t::text, "+0button");
    expect(quakemap::token_type_t::text, "128x");
    expect(quakemap::token_type_t::undetermined, "#");
    expect(quakemap::token_type_t::eof, "");

    // stays at the end
    EXPECT_EQ(quakemap::token_type_t::eof, scanner.read().type);
}

TEST(quakemap, scannerPositions)
{
    quakemap::scanner_t scanner("{\n  \"key\"");

    auto open = scanner.read();
    EXPECT_EQ(1, open.line);
    EXPECT_EQ(1, open.column);

    auto key = scanner.read();
    EXPECT_EQ(2, key.line);
    EXPECT_EQ(3, key.column);
    EXPECT_EQ(4, key.start);
    EXPECT_EQ(9, key.end);
    EXPECT_EQ("key", key.text);
}

TEST(quakemap, scannerPeekIsIdempotent)
{
    quakemap::scanner_t scanner("{ }");

    EXPECT_EQ(quakemap::token_type_t::brace_open, scanner.peek().type);
    EXPECT_EQ(quakemap::token_type_t::brace_open, scanner.peek().type);
    EXPECT_EQ(quakemap::token_type_t::brace_open, scanner.read().type);
    EXPECT_EQ(quakemap::token_type_t::brace_close, scanner.read().type);
}

TEST(quakemap, scannerUnterminatedString)
{
    quakemap::scanner_t scanner("\"never closed");

    auto token = scanner.read();
    EXPECT_EQ(quakemap::token_type_t::quoted_string, token.type);
    EXPECT_TRUE(token.unterminated);
    EXPECT_EQ("never closed", token.text);
    EXPECT_EQ(quakemap::token_type_t::eof, scanner.read().type);
}

TEST(quakemap, scannerNulEndsInput)
{
    using namespace std::literals;
    quakemap::scanner_t scanner("{\0}"sv);

    EXPECT_EQ(quakemap::token_type_t::brace_open, scanner.read().type);
    EXPECT_EQ(quakemap::token_type_t::eof, scanner.read().type);
}

TEST(quakemap, legacyCube)
{
    auto map = LoadMapOrFail(legacy_cube);

    ASSERT_EQ(1, map.entities.size());

    auto &world = map.entities[0];
    EXPECT_EQ("worldspawn", world.epairs.get("classname"));
    ASSERT_EQ(1, world.brushes.size());
    ASSERT_EQ(6, world.brushes[0].planes.size());
    EXPECT_EQ(1, map.total_brushes());
    EXPECT_EQ(6, map.total_planes());

    auto &plane = world.brushes[0].planes[0];
    EXPECT_FALSE(plane.is_valve220);
    EXPECT_EQ(qvec3d(-16, -64, -16), plane.point1);
    EXPECT_EQ(qvec3d(-16, -63, -16), plane.point2);
    EXPECT_EQ(qvec3d(-16, -64, -15), plane.point3);
    EXPECT_EQ("__TB_empty", plane.texture);
    EXPECT_EQ(qvec3d(0, 0, 0), plane.axis1);
    EXPECT_EQ(qvec2d(1, 1), plane.scale);
}

TEST(quakemap, valveCube)
{
    auto map = LoadMapOrFail(valve_cube);

    ASSERT_EQ(1, map.entities.size());
    EXPECT_EQ("220", map.entities[0].epairs.get("mapversion"));
    ASSERT_EQ(1, map.entities[0].brushes.size());

    auto &planes = map.entities[0].brushes[0].planes;
    ASSERT_EQ(6, planes.size());

    for (auto &plane : planes) {
        EXPECT_TRUE(plane.is_valve220);
    }

    EXPECT_EQ(qvec3d(0, -1, 0), planes[0].axis1);
    EXPECT_EQ(qvec3d(0, 0, -1), planes[0].axis2);
    EXPECT_EQ(qvec2d(0, 0), planes[0].offsets);

    EXPECT_EQ(qvec3d(0, 1, 0), planes[5].axis1);
    EXPECT_EQ(45, planes[5].rotation);
    EXPECT_EQ(qvec2d(0.5, 2), planes[5].scale);
}

TEST(quakemap, cubeFromDisk)
{
    auto data = fs::load(fs::path(testmaps_dir) / "cube_legacy.map");
    ASSERT_TRUE(data);

    auto map = LoadMapOrFail(fs::as_text(data));
    ASSERT_EQ(2, map.entities.size());
    EXPECT_EQ("info_player_start", map.entities[1].epairs.get("classname"));
    EXPECT_TRUE(map.entities[1].brushes.empty());
}

TEST(quakemap, emptySource)
{
    auto result = quakemap::parse("// nothing but a comment\n");

    EXPECT_TRUE(result.ok());
    ASSERT_TRUE(result.map);
    EXPECT_TRUE(result.map->entities.empty());
}

TEST(quakemap, emptyBrush)
{
    auto map = LoadMapOrFail(R"({ "classname" "func_group" { } })");

    ASSERT_EQ(1, map.entities.size());
    ASSERT_EQ(1, map.entities[0].brushes.size());
    EXPECT_TRUE(map.entities[0].brushes[0].planes.empty());
}

TEST(quakemap, hugeIntegerCoordinate)
{
    // wider than int64, still a plain number
    auto map = LoadMapOrFail(R"({
{
( 10000000000000000000 0 0 ) ( 0 1 0 ) ( -99999999999999999999 0 0 ) tex 0 0 0 1 1
}
})");

    ASSERT_EQ(1, map.entities.size());
    ASSERT_EQ(1, map.entities[0].brushes.size());
    ASSERT_EQ(1, map.entities[0].brushes[0].planes.size());

    auto &plane = map.entities[0].brushes[0].planes[0];
    EXPECT_EQ(1e19, plane.point1[0]);
    EXPECT_DOUBLE_EQ(-1e20, plane.point3[0]);
}

TEST(quakemap, quotedAndNumericTextureNames)
{
    auto map = LoadMapOrFail(R"({
{
( 0 0 0 ) ( 0 1 0 ) ( 1 0 0 ) "sky 1" 0 0 0 1 1
( 0 0 0 ) ( 0 1 0 ) ( 1 0 0 ) 1024 0 0 0 1 1
}
})");

    ASSERT_EQ(1, map.entities.size());
    ASSERT_EQ(1, map.entities[0].brushes.size());

    auto &planes = map.entities[0].brushes[0].planes;
    ASSERT_EQ(2, planes.size());
    EXPECT_EQ("sky 1", planes[0].texture);
    EXPECT_EQ("1024", planes[1].texture);
}

TEST(quakemap, lastKeyWins)
{
    auto map = LoadMapOrFail(R"({
"classname" "light"
"light" "200"
"light" "300"
})");

    ASSERT_EQ(1, map.entities.size());

    auto &epairs = map.entities[0].epairs;
    EXPECT_EQ(2, epairs.size());
    EXPECT_EQ("300", epairs.get("light"));

    // keeps the position of the first occurrence
    EXPECT_EQ("light", std::next(epairs.begin())->first);
}

TEST(quakemap, brokenEntitiesAllReported)
{
    auto result = quakemap::parse(R"(
{
"classname" "worldspawn"
{
( 0 0 0 ) ( 0 1 0 ) __TB_empty 0 0 0 1 1
}
}
{
"classname" "light"
"origin"
}
{
"classname" "info_null"
}
)");

    EXPECT_FALSE(result.map);
    EXPECT_FALSE(result.ok());
    ASSERT_EQ(2, result.errors.size());

    // the missing point
    EXPECT_EQ(5, result.errors[0].line);
    EXPECT_NE(std::string::npos, result.errors[0].message.find("'('"));

    // the key without a value
    EXPECT_EQ(11, result.errors[1].line);
    EXPECT_NE(std::string::npos, result.errors[1].message.find("quoted value"));
}

TEST(quakemap, brokenFromDisk)
{
    auto data = fs::load(fs::path(testmaps_dir) / "broken.map");
    ASSERT_TRUE(data);

    auto result = quakemap::parse(fs::as_text(data));
    EXPECT_FALSE(result.map);
    EXPECT_GE(result.errors.size(), 2);
}

TEST(quakemap, unterminatedString)
{
    auto result = quakemap::parse("{\n\"classname\" \"worldspawn\n}\n");

    EXPECT_FALSE(result.map);
    ASSERT_EQ(1, result.errors.size());
    EXPECT_EQ("unterminated quoted string", result.errors[0].message);
    EXPECT_EQ(2, result.errors[0].line);
    EXPECT_EQ(13, result.errors[0].column);
}

TEST(quakemap, unexpectedEndOfFile)
{
    auto result = quakemap::parse("{ \"classname\" \"worldspawn\" { ( 0 0 0 ) ( 0 1 0 ) ( 1 0 0 ) tex 0 0 0 1 1");

    EXPECT_FALSE(result.map);
    ASSERT_EQ(1, result.errors.size());
    EXPECT_NE(std::string::npos, result.errors[0].message.find("end of file"));
}

TEST(quakemap, strayTopLevelTokens)
{
    auto result = quakemap::parse("junk more junk\n{ \"classname\" \"worldspawn\" }");

    EXPECT_FALSE(result.map);
    ASSERT_EQ(1, result.errors.size());
    EXPECT_EQ("expected '{', got 'junk'", result.errors[0].message);
}

TEST(quakemap, parserIsReusable)
{
    quakemap::parser_t parser;

    EXPECT_FALSE(parser.parse("}"));
    EXPECT_EQ(1, parser.errors().size());

    auto map = parser.parse(legacy_cube);
    ASSERT_TRUE(map);
    EXPECT_TRUE(parser.errors().empty());
    EXPECT_EQ(6, map->total_planes());
}

TEST(quakemap, errorFormat)
{
    quakemap::parse_error_t error{"expected '{', got 'x'", 3, 7, 20, 1};

    EXPECT_EQ("3:7: expected '{', got 'x'", fmt::format("{}", error));
}

TEST(quakemap, leasesBalancedAfterErrors)
{
    auto &planes = pool::array_pool<quakemap::plane_t>::shared();
    auto &brushes = pool::array_pool<quakemap::brush_t>::shared();

    auto result = quakemap::parse(R"(
{
{
( 0 0 0 ) ( 0 1 0 ) ( 1 0 0 ) tex 0 0 0 1 1
( 0 0 0 ) ( 0 1 0 )
}
}
{
{
( 0 0 0 ) ( 0 1 0 ) ( 1 0 0 ) tex 0 0 0 1 1
}
)");

    EXPECT_FALSE(result.map);
    EXPECT_EQ(2, result.errors.size());
    EXPECT_EQ(0, planes.outstanding());
    EXPECT_EQ(0, brushes.outstanding());
    EXPECT_GT(planes.rented(), 0);
}

TEST(quakemap, entdictTypedGetters)
{
    quakemap::entdict_t dict{
        {"light", "300"},
        {"wait", " 0.5 "},
        {"spawnflags", "+4"},
        {"origin", "0 128 -64"},
        {"angles", "0 90"},
        {"_dirt", "TRUE"},
        {"_sunlight", "1"},
        {"target", "t1"},
    };

    EXPECT_EQ(300, dict.get_int("light"));
    EXPECT_EQ(4, dict.get_int("spawnflags"));
    EXPECT_EQ(std::nullopt, dict.get_int("wait"));
    EXPECT_EQ(std::nullopt, dict.get_int("target"));
    EXPECT_EQ(std::nullopt, dict.get_int("missing"));

    EXPECT_EQ(0.5, dict.get_float("wait"));
    EXPECT_EQ(300.0, dict.get_float("light"));

    EXPECT_EQ(true, dict.get_bool("_dirt"));
    EXPECT_EQ(true, dict.get_bool("_sunlight"));
    EXPECT_EQ(std::nullopt, dict.get_bool("target"));

    EXPECT_EQ(qvec3d(0, 128, -64), dict.get_vector<3>("origin"));
    EXPECT_EQ(std::nullopt, dict.get_vector<3>("angles"));
    EXPECT_EQ(std::nullopt, dict.get_vector<1>("origin"));

    EXPECT_EQ("", dict.get("missing"));
    EXPECT_TRUE(dict.has("target"));

    // keys are case-sensitive
    EXPECT_FALSE(dict.has("TARGET"));

    dict.remove("target");
    EXPECT_FALSE(dict.has("target"));
}
