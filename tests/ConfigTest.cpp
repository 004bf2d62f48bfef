#include <gtest/gtest.h>

#include <stdexcept>

#include "Core/Config.hpp"
#include "TestUtils.hpp"

namespace cfgadguard::test {

class ConfigTest : public ::testing::Test {
protected:
    TestUtils::ScopedEnv mEnv {Config::PATH_ENV_VAR};
    TestUtils::TempDir   mDir;
};

TEST_F(ConfigTest, EmptyObjectGivesDefaults)
{
    const auto s = Config::Parse("{}");

    EXPECT_EQ(s.reload.program, "resolvconf");
    ASSERT_EQ(s.reload.args.size(), 1u);
    EXPECT_EQ(s.reload.args[0], "-u");

    EXPECT_EQ(s.lookup.program, "nslookup");
    ASSERT_EQ(s.lookup.args.size(), 1u);
    EXPECT_EQ(s.lookup.args[0], "wikipedia.org");

    EXPECT_TRUE(s.flush_resolved_cache);
    EXPECT_TRUE(s.log.directory.empty());
    EXPECT_EQ(s.log.console_min_severity, boost::log::trivial::fatal);
}

TEST_F(ConfigTest, ParsesAllKeys)
{
    const auto s = Config::Parse(R"({
        "log_directory": "/var/log/cfg-adguard-dns",
        "console_log_level": "debug",
        "file_log_level": "warning",
        "reload_command": ["/sbin/resolvconf", "-u"],
        "lookup_command": ["dig", "+short", "wikipedia.org"],
        "flush_resolved_cache": false
    })");

    EXPECT_EQ(s.log.directory, "/var/log/cfg-adguard-dns");
    EXPECT_EQ(s.log.console_min_severity, boost::log::trivial::debug);
    EXPECT_EQ(s.log.file_min_severity, boost::log::trivial::warning);
    EXPECT_EQ(s.reload.program, "/sbin/resolvconf");
    EXPECT_EQ(s.lookup.program, "dig");
    ASSERT_EQ(s.lookup.args.size(), 2u);
    EXPECT_EQ(s.lookup.args[0], "+short");
    EXPECT_FALSE(s.flush_resolved_cache);
}

TEST_F(ConfigTest, WrongTypesAreRejected)
{
    EXPECT_THROW(Config::Parse(R"({"flush_resolved_cache": "yes"})"), std::runtime_error);
    EXPECT_THROW(Config::Parse(R"({"reload_command": "resolvconf -u"})"), std::runtime_error);
    EXPECT_THROW(Config::Parse(R"({"reload_command": []})"), std::runtime_error);
    EXPECT_THROW(Config::Parse(R"({"lookup_command": ["nslookup", 1]})"), std::runtime_error);
    EXPECT_THROW(Config::Parse(R"({"console_log_level": "loud"})"), std::runtime_error);
    EXPECT_THROW(Config::Parse("[]"), std::runtime_error);
}

TEST_F(ConfigTest, MalformedJsonIsRejected)
{
    EXPECT_ANY_THROW(Config::Parse("{ not json"));
}

TEST_F(ConfigTest, RequireHelpers)
{
    boost::json::object o;
    o["name"]  = "value";
    o["flag"]  = true;
    o["list"]  = boost::json::array{"a", "b"};

    EXPECT_EQ(Config::RequireString(o, "name"), "value");
    EXPECT_TRUE(Config::RequireBool(o, "flag"));
    EXPECT_EQ(Config::RequireStringArray(o, "list"), (std::vector<std::string>{"a", "b"}));

    EXPECT_THROW(Config::RequireString(o, "missing"), std::runtime_error);
    EXPECT_THROW(Config::RequireBool(o, "name"), std::runtime_error);
}

TEST_F(ConfigTest, GetPathHonoursEnv)
{
    mEnv.Set("/tmp/cfg.json");
    EXPECT_EQ(Config::GetPath(), "/tmp/cfg.json");

    mEnv.Unset();
    EXPECT_EQ(Config::GetPath(), "/etc/cfg-adguard-dns/config.json");
}

TEST_F(ConfigTest, LoadMissingFileGivesDefaults)
{
    const auto s = Config::Load(mDir.File("absent.json").string());

    EXPECT_EQ(s.reload.program, "resolvconf");
}

TEST_F(ConfigTest, LoadReadsFile)
{
    const auto path = mDir.File("config.json");
    TestUtils::WriteFile(path, R"({"reload_command": ["true"]})");

    const auto s = Config::Load(path.string());

    EXPECT_EQ(s.reload.program, "true");
    EXPECT_TRUE(s.reload.args.empty());
}

TEST_F(ConfigTest, LoadBrokenFileNamesThePath)
{
    const auto path = mDir.File("config.json");
    TestUtils::WriteFile(path, "{");

    try {
        Config::Load(path.string());
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
}

} // namespace cfgadguard::test
