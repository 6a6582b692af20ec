#include <gtest/gtest.h>
#include "../src/core/Config.h"
#include <cstdlib>
#include <map>
#include <string>

namespace testsum {

class ConfigTest : public ::testing::Test {
protected:
    EnvLookup env() {
        return [this](const std::string& key) -> std::optional<std::string> {
            auto it = vars.find(key);
            if(it == vars.end()) return std::nullopt;
            return it->second;
        };
    }

    std::map<std::string, std::string> vars;
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    RunOptions opts = default_options(env());
    EXPECT_EQ(opts.format, "short");
    EXPECT_EQ(opts.json_file, "");
    EXPECT_EQ(opts.junit_file, "");
    EXPECT_FALSE(opts.debug);
    EXPECT_FALSE(opts.raw_command);
    EXPECT_FALSE(opts.no_color);
    EXPECT_TRUE(opts.args.empty());
    EXPECT_TRUE(opts.no_summary.empty());
}

TEST_F(ConfigTest, EnvironmentBackedDefaults) {
    vars["TESTSUM_FORMAT"] = "dots";
    vars["TESTSUM_JSONFILE"] = "events.json";
    vars["TESTSUM_JUNITFILE"] = "junit.xml";
    RunOptions opts = default_options(env());
    EXPECT_EQ(opts.format, "dots");
    EXPECT_EQ(opts.json_file, "events.json");
    EXPECT_EQ(opts.junit_file, "junit.xml");
}

TEST_F(ConfigTest, GotestsumNamesAreHonoured) {
    vars["GOTESTSUM_FORMAT"] = "standard-verbose";
    vars["GOTESTSUM_JSONFILE"] = "legacy.json";
    vars["GOTESTSUM_JUNITFILE"] = "legacy.xml";
    RunOptions opts = default_options(env());
    EXPECT_EQ(opts.format, "standard-verbose");
    EXPECT_EQ(opts.json_file, "legacy.json");
    EXPECT_EQ(opts.junit_file, "legacy.xml");
}

TEST_F(ConfigTest, TestsumNamesWinOverGotestsumNames) {
    vars["TESTSUM_FORMAT"] = "dots";
    vars["GOTESTSUM_FORMAT"] = "standard-verbose";
    vars["TESTSUM_JUNITFILE"] = "";
    vars["GOTESTSUM_JUNITFILE"] = "legacy.xml";
    RunOptions opts = default_options(env());
    EXPECT_EQ(opts.format, "dots");
    EXPECT_EQ(opts.junit_file, "");
}

TEST_F(ConfigTest, SetButEmptyOverridesDefault) {
    vars["TESTSUM_FORMAT"] = "";
    EXPECT_EQ(default_options(env()).format, "");
}

TEST_F(ConfigTest, NullLookupFallsBack) {
    EXPECT_EQ(lookup_env_with_default(EnvLookup(), "TESTSUM_FORMAT", "short"), "short");
}

TEST_F(ConfigTest, ProcessEnvironment) {
    ::setenv("TESTSUM_CONFIG_TEST_VAR", "value", 1);
    ::unsetenv("TESTSUM_CONFIG_TEST_UNSET");
    EnvLookup lookup = process_env();
    EXPECT_EQ(lookup("TESTSUM_CONFIG_TEST_VAR"), std::optional<std::string>("value"));
    EXPECT_EQ(lookup("TESTSUM_CONFIG_TEST_UNSET"), std::nullopt);
    ::unsetenv("TESTSUM_CONFIG_TEST_VAR");
}

} // namespace testsum
