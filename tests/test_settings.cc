#include <gtest/gtest.h>

#include "common/settings.hh"
#include "common/log.hh"

#include <mapscan/mapscan.hh>

// test booleans
TEST(settings, booleanFlagImplicit)
{
    settings::setting_container settings;
    settings::setting_bool boolSetting(&settings, "dump", false);
    const char *arguments[] = {"mapscan.exe", "-dump"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    auto remainder = settings.parse(p);
    ASSERT_EQ(boolSetting.value(), true);
    ASSERT_TRUE(remainder.empty());
}

TEST(settings, booleanFlagExplicit)
{
    settings::setting_container settings;
    settings::setting_bool boolSetting(&settings, "dump", false);
    const char *arguments[] = {"mapscan.exe", "-dump", "1"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    auto remainder = settings.parse(p);
    ASSERT_EQ(boolSetting.value(), true);
    ASSERT_TRUE(remainder.empty());
}

TEST(settings, booleanFlagExplicitOff)
{
    settings::setting_container settings;
    settings::setting_bool boolSetting(&settings, "dump", true);
    const char *arguments[] = {"mapscan.exe", "-dump", "0"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    auto remainder = settings.parse(p);
    ASSERT_EQ(boolSetting.value(), false);
    ASSERT_TRUE(remainder.empty());
}

TEST(settings, booleanFlagStray)
{
    settings::setting_container settings;
    settings::setting_bool boolSetting(&settings, "dump", false);
    const char *arguments[] = {"mapscan.exe", "-dump", "stray.map"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    auto remainder = settings.parse(p);
    ASSERT_EQ(boolSetting.value(), true);
    ASSERT_EQ(remainder, (std::vector<std::string>{"stray.map"}));
}

TEST(settings, invertibleBool)
{
    settings::setting_container settings;
    settings::setting_invertible_bool logSetting(&settings, "log", true);
    const char *arguments[] = {"mapscan.exe", "-nolog"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    settings.parse(p);
    ASSERT_EQ(logSetting.value(), false);
}

// test int32
TEST(settings, int32Simple)
{
    settings::setting_container settings;
    settings::setting_int32 setting(&settings, "threads", 0);
    const char *arguments[] = {"mapscan.exe", "-threads", "4"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    auto remainder = settings.parse(p);
    ASSERT_EQ(setting.value(), 4);
    ASSERT_TRUE(remainder.empty());
}

TEST(settings, int32Clamped)
{
    settings::setting_container settings;
    settings::setting_int32 setting(&settings, "level", 2, 0, 4);
    const char *arguments[] = {"mapscan.exe", "-level", "-3"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    settings.parse(p);
    ASSERT_EQ(setting.value(), 0);
}

TEST(settings, int32EOF)
{
    settings::setting_container settings;
    settings::setting_int32 setting(&settings, "threads", 0);
    const char *arguments[] = {"mapscan.exe", "-threads"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    ASSERT_THROW(settings.parse(p), settings::parse_exception);
}

TEST(settings, int32Stray)
{
    settings::setting_container settings;
    settings::setting_int32 setting(&settings, "threads", 0);
    const char *arguments[] = {"mapscan.exe", "-threads", "stray"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    ASSERT_THROW(settings.parse(p), settings::parse_exception);
}

// test enum

enum class testenum
{
    A = 0,
    B = 1,
    C = 2
};

class SettingEnumTest : public testing::Test
{
protected:
    settings::setting_container settings;

    settings::setting_enum<testenum> enum_setting{
        &settings, "enum", testenum::A, {{"A", testenum::A}, {"B", testenum::B}, {"C", testenum::C}}};

    settings::setting_int32 int_setting{&settings, "count", 1};

    std::vector<std::string> parse(std::vector<const char *> arguments)
    {
        arguments.insert(arguments.begin(), "mapscan.exe");
        token_parser_t p{static_cast<int>(arguments.size()) - 1, arguments.data() + 1, "command line"};
        return settings.parse(p);
    }
};

TEST_F(SettingEnumTest, enumRequired)
{
    ASSERT_EQ(parse({"-enum", "C", "-count", "3"}), std::vector<std::string>());
    ASSERT_EQ(enum_setting.value(), testenum::C);
    ASSERT_EQ(int_setting.value(), 3);
}

TEST_F(SettingEnumTest, enumCaseInsensitive)
{
    ASSERT_EQ(parse({"-enum", "b", "file.map"}), (std::vector<std::string>{"file.map"}));
    ASSERT_EQ(enum_setting.value(), testenum::B);
}

TEST_F(SettingEnumTest, enumRequiredArgMissing)
{
    ASSERT_THROW(parse({"-enum", "-count", "3"}), settings::parse_exception);
    ASSERT_EQ(int_setting.value(), 1);
}

TEST_F(SettingEnumTest, enumStringValue)
{
    parse({"-enum", "C"});
    ASSERT_EQ(enum_setting.string_value(), "C");
    ASSERT_EQ(enum_setting.format(), "A | B | C");
}

// test paths
TEST(settings, pathWithSpaces)
{
    settings::setting_container settings;
    settings::setting_path pathSetting(&settings, "logfile", "");
    const char *arguments[] = {"mapscan.exe", "-logfile", "my logs/scan output.log"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    auto remainder = settings.parse(p);
    ASSERT_EQ(pathSetting.value(), fs::path(arguments[2]));
    ASSERT_TRUE(remainder.empty());
}

TEST(settings, pathSimple)
{
    settings::setting_container settings;
    settings::setting_path pathSetting(&settings, "logfile", "");
    const char *arguments[] = {"mapscan.exe", "-logfile", "logs/out.log"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    settings.parse(p);
    ASSERT_EQ(pathSetting.value(), fs::path("logs/out.log"));
    ASSERT_TRUE(pathSetting.is_changed());
}

// test remainder
TEST(settings, remainder)
{
    settings::setting_container settings;
    settings::setting_path pathSetting(&settings, "logfile", "");
    settings::setting_bool flagSetting(&settings, "flag", false);
    const char *arguments[] = {"mapscan.exe", "-logfile", "out.log", "-flag", "remainder one", "remainder two"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    auto remainder = settings.parse(p);
    ASSERT_EQ(remainder[0], "remainder one");
    ASSERT_EQ(remainder[1], "remainder two");
}

// test double-hyphens
TEST(settings, doubleHyphen)
{
    settings::setting_container settings;
    settings::setting_bool boolSetting(&settings, "dump", false);
    settings::setting_int32 intSetting(&settings, "threads", 0);
    const char *arguments[] = {"mapscan.exe", "--dump", "--threads", "2"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    auto remainder = settings.parse(p);
    ASSERT_EQ(boolSetting.value(), true);
    ASSERT_EQ(intSetting.value(), 2);
    ASSERT_TRUE(remainder.empty());
}

TEST(settings, unknownOption)
{
    settings::setting_container settings;
    settings::setting_bool boolSetting(&settings, "dump", false);
    const char *arguments[] = {"mapscan.exe", "-bogus"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    ASSERT_THROW(settings.parse(p), settings::parse_exception);
}

TEST(settings, redirect)
{
    settings::setting_container settings;
    settings::setting_bool a(&settings, "a", false);
    settings::setting_bool b(&settings, "b", false);
    settings::setting_redirect both(&settings, "both", {&a, &b});
    const char *arguments[] = {"mapscan.exe", "-both"};
    token_parser_t p{std::size(arguments) - 1, arguments + 1, "command line"};
    settings.parse(p);
    ASSERT_TRUE(a.value());
    ASSERT_TRUE(b.value());
}

// test groups; ensure that performance is the first group
TEST(settings, grouping)
{
    settings::setting_container settings;
    settings::setting_group performance{"Performance", -1000};
    settings::setting_group others{"Others", 1000};
    settings::setting_int32 intSetting(&settings, "threads", 0, &performance, "number of threads; zero for automatic");
    settings::setting_bool boolSetting(&settings, "dump", false, &others, "print parsed contents");
    settings::setting_path pathSetting(&settings, "logfile", "", &others, "where the log goes");
    ASSERT_EQ(settings.grouped().begin()->first, &performance);
}

TEST(settings, helpWithLongName)
{
    settings::setting_container settings;
    settings::setting_bool shortSetting(&settings, "dump", false, nullptr, "short one");
    settings::setting_bool longSetting(
        &settings, "a_very_long_option_name_past_the_column", false, nullptr, "long one");

    testing::internal::CaptureStdout();
    EXPECT_THROW(settings.print_help(), settings::quit_after_help_exception);
    std::string output = testing::internal::GetCapturedStdout();

    // a name wider than the column gets no padding rather than a huge one
    EXPECT_NE(std::string::npos, output.find("  -a_very_long_option_name_past_the_column     long one\n"));
    EXPECT_NE(std::string::npos, output.find("  -dump                         short one\n"));
    EXPECT_LT(output.size(), 1024);
}

TEST(settings, resetBool)
{
    settings::setting_container settings;
    settings::setting_bool boolSetting1(&settings, "boolSetting", false);

    boolSetting1.set_value(true, settings::source::COMMANDLINE);
    EXPECT_EQ(settings::source::COMMANDLINE, boolSetting1.get_source());
    EXPECT_TRUE(boolSetting1.value());

    boolSetting1.reset();
    EXPECT_EQ(settings::source::DEFAULT, boolSetting1.get_source());
    EXPECT_FALSE(boolSetting1.value());
}

TEST(settings, resetContainer)
{
    settings::setting_container settings;
    settings::setting_int32 intSetting1(&settings, "count", 3);
    settings::setting_path pathSetting1(&settings, "logfile", "abc.log");

    intSetting1.set_value(-1, settings::source::COMMANDLINE);
    pathSetting1.set_value("test.log", settings::source::COMMANDLINE);
    settings.reset();

    EXPECT_EQ(settings::source::DEFAULT, intSetting1.get_source());
    EXPECT_EQ(3, intSetting1.value());

    EXPECT_EQ(settings::source::DEFAULT, pathSetting1.get_source());
    EXPECT_EQ(fs::path("abc.log"), pathSetting1.value());
}

// the tool's own options
TEST(settings, mapscanOptions)
{
    settings::mapscan_settings options;
    const char *arguments[] = {"mapscan.exe", "-format", "map", "-udmf", "zdoom", "-dump", "-quiet", "e1m1", "b.map"};
    options.preinitialize(std::size(arguments), arguments);
    options.initialize(std::size(arguments), arguments);

    EXPECT_EQ(map_format_t::quake, options.format.value());
    EXPECT_EQ(udmf_schema_t::zdoom, options.udmf_schema.value());
    EXPECT_TRUE(options.dump.value());
    EXPECT_TRUE(options.nopercent.value());
    EXPECT_TRUE(options.nostat.value());
    EXPECT_TRUE(options.noprogress.value());
    EXPECT_EQ("mapscan", options.program_name);

    // a bare name gets .map when the format is forced
    ASSERT_EQ(2, options.sources.size());
    EXPECT_EQ(fs::path("e1m1.map"), options.sources[0]);
    EXPECT_EQ(fs::path("b.map"), options.sources[1]);
}

TEST(settings, mapscanOptionsReset)
{
    settings::mapscan_settings options;
    const char *arguments[] = {"mapscan.exe", "-format", "udmf", "TEXTMAP"};
    options.preinitialize(std::size(arguments), arguments);
    options.initialize(std::size(arguments), arguments);

    EXPECT_EQ(map_format_t::udmf, options.format.value());
    EXPECT_EQ(fs::path("TEXTMAP"), options.sources.at(0));

    options.reset();

    EXPECT_EQ(map_format_t::automatic, options.format.value());
    EXPECT_TRUE(options.sources.empty());
    EXPECT_TRUE(options.remainder.empty());
}

TEST(settings, mapscanHelpWithoutFiles)
{
    settings::mapscan_settings options;
    const char *arguments[] = {"mapscan.exe", "-dump"};
    options.preinitialize(std::size(arguments), arguments);
    EXPECT_THROW(options.initialize(std::size(arguments), arguments), settings::quit_after_help_exception);
}
