#include <gtest/gtest.h>

#include <common/log.hh>
#include <mapscan/mapscan.hh>

#include "test_main.hh"
#include "testmaps.hh"

static std::string TestMap(const char *name)
{
    return (fs::path(testmaps_dir) / name).string();
}

TEST(mapscan, detectFormat)
{
    EXPECT_EQ(map_format_t::quake, detect_format("e1m1.map"));
    EXPECT_EQ(map_format_t::quake, detect_format("maps/start.MAP"));
    EXPECT_EQ(map_format_t::quake, detect_format("noextension"));
    EXPECT_EQ(map_format_t::udmf, detect_format("MAP01/TEXTMAP"));
    EXPECT_EQ(map_format_t::udmf, detect_format("textmap"));
    EXPECT_EQ(map_format_t::udmf, detect_format("map01.udmf"));
    EXPECT_EQ(map_format_t::udmf, detect_format("map01.TXT"));
}

TEST(mapscan, scanQuakeSource)
{
    auto result = scan_source(R"({
"classname" "worldspawn"
{
( 0 0 0 ) ( 0 1 0 ) ( 1 0 0 ) tex 0 0 0 1 1
( 0 0 0 ) ( 0 1 0 ) ( 1 0 0 ) tex [ 1 0 0 8 ] [ 0 -1 0 0 ] 0 1 1
}
}
{
"classname" "light"
})",
        map_format_t::quake, udmf_schema_t::standard, true);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(2, result.entities);
    EXPECT_EQ(1, result.brushes);
    EXPECT_EQ(2, result.planes);
    EXPECT_EQ(0, result.blocks);

    EXPECT_NE(std::string::npos, result.dump.find("entity 0 (1 brushes)"));
    EXPECT_NE(std::string::npos, result.dump.find("\"classname\" \"light\""));
    EXPECT_NE(std::string::npos, result.dump.find("(0 0 0) (0 1 0) (1 0 0) tex [1 0 0 8]"));
}

TEST(mapscan, scanQuakeErrors)
{
    auto result = scan_source("{\n\"classname\"\n}", map_format_t::quake, udmf_schema_t::standard, true);

    EXPECT_FALSE(result.ok());
    ASSERT_EQ(1, result.errors.size());
    EXPECT_EQ(3, result.errors[0].line);
    EXPECT_EQ(1, result.errors[0].column);
    EXPECT_EQ(0, result.entities);
    EXPECT_TRUE(result.dump.empty());
}

TEST(mapscan, scanUdmfSource)
{
    const char *source = R"(
namespace = "zdoom";
vertex { x = 0.0; y = 0.0; zfloor = 4.0; }
vertex { x = 1.0; y = 0.0; }
editorstate { lastcamera = 3; }
)";

    auto standard = scan_source(source, map_format_t::udmf, udmf_schema_t::standard, true);

    EXPECT_TRUE(standard.ok());
    EXPECT_EQ(3, standard.blocks);
    EXPECT_NE(std::string::npos, standard.dump.find("namespace \"zdoom\""));
    EXPECT_NE(std::string::npos, standard.dump.find("2 vertices, 0 linedefs"));
    EXPECT_NE(std::string::npos, standard.dump.find("editorstate\n    lastcamera = 3 (integer)"));

    auto zdoom = scan_source(source, map_format_t::udmf, udmf_schema_t::zdoom, false);

    EXPECT_TRUE(zdoom.ok());
    EXPECT_EQ(3, zdoom.blocks);
    EXPECT_TRUE(zdoom.dump.empty());
}

TEST(mapscan, scanUdmfErrors)
{
    auto result =
        scan_source("vertex { x = true; }\nthing { }", map_format_t::udmf, udmf_schema_t::standard, false);

    EXPECT_FALSE(result.ok());
    ASSERT_EQ(1, result.errors.size());
    EXPECT_EQ(1, result.errors[0].line);
    EXPECT_EQ(14, result.errors[0].column);
    EXPECT_EQ("Expected Float, got Identifier.", result.errors[0].message);

    // the document comes back either way
    EXPECT_EQ(2, result.blocks);
}

TEST(mapscan, scanNeedsResolvedFormat)
{
    EXPECT_THROW(scan_source("", map_format_t::automatic, udmf_schema_t::standard, false), mapscan_error);
}

TEST(mapscan, mainAllGood)
{
    EXPECT_EQ(0, mapscan_main(std::vector<std::string>{
                     "mapscan", TestMap("cube_legacy.map"), TestMap("cube_valve.map"), TestMap("sample.udmf")}));
}

TEST(mapscan, mainReportsErrors)
{
    std::vector<std::string> lines;
    logging::set_print_callback([&](logging::flag, const char *text) { lines.emplace_back(text); });

    int ret = mapscan_main(std::vector<std::string>{"mapscan", TestMap("cube_legacy.map"), TestMap("broken.map")});

    logging::set_print_callback(nullptr);

    EXPECT_EQ(1, ret);

    bool reported = false;

    for (auto &line : lines) {
        if (line.find("broken.map: 2 errors") != std::string::npos) {
            reported = true;
        }
    }

    EXPECT_TRUE(reported);
}

TEST(mapscan, mainForcedFormat)
{
    // read as UDMF, a .map is nonsense
    EXPECT_EQ(1, mapscan_main(std::vector<std::string>{"mapscan", "-format", "udmf", TestMap("cube_legacy.map")}));

    // and the other way around
    EXPECT_EQ(1, mapscan_main(std::vector<std::string>{"mapscan", "-format", "map", TestMap("sample.udmf")}));

    EXPECT_EQ(0, mapscan_main(std::vector<std::string>{"mapscan", "-udmf", "zdoom", "-dump", TestMap("sample.udmf")}));
}

TEST(mapscan, mainMissingFile)
{
    EXPECT_EQ(1, mapscan_main(std::vector<std::string>{"mapscan", TestMap("does_not_exist.map")}));
}

TEST(mapscan, mainHelpWithoutFiles)
{
    EXPECT_EQ(0, mapscan_main(std::vector<std::string>{"mapscan"}));
}
