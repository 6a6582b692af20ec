#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>

namespace testsum {

constexpr const char* kEnvFormat = "TESTSUM_FORMAT";
constexpr const char* kEnvJsonFile = "TESTSUM_JSONFILE";
constexpr const char* kEnvJUnitFile = "TESTSUM_JUNITFILE";
constexpr const char* kEnvTestDirectory = "TEST_DIRECTORY";
// Names read by gotestsum; used when the TESTSUM_ variable is unset.
constexpr const char* kEnvFormatCompat = "GOTESTSUM_FORMAT";
constexpr const char* kEnvJsonFileCompat = "GOTESTSUM_JSONFILE";
constexpr const char* kEnvJUnitFileCompat = "GOTESTSUM_JUNITFILE";
constexpr const char* kDefaultFormat = "short";

// Returns the value of an environment variable, or nullopt when unset.
// A set-but-empty variable yields an empty string, not nullopt.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();
std::string lookup_env_with_default(const EnvLookup& env, const std::string& key, const std::string& def);

struct RunOptions {
    std::vector<std::string> args; // positional, passed through to the test command
    std::string format = kDefaultFormat;
    bool debug = false;
    bool raw_command = false; // don't prepend "go test -json"
    std::string json_file; // copy of every event line
    std::string junit_file;
    bool no_color = false;
    std::vector<std::string> no_summary; // section names to suppress
};

// Options with environment-backed defaults applied, before flag parsing.
RunOptions default_options(const EnvLookup& env);

}
