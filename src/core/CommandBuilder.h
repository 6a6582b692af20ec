#pragma once
#include "Config.h"
#include <string>
#include <vector>

namespace testsum {

constexpr const char* kDefaultTestPath = "./...";

// Builds the argv of the test command. Pure function of opts and env.
std::vector<std::string> compose_test_command(const RunOptions& opts, const EnvLookup& env);

// True if args already request structured output ("-json" or "--json").
bool has_json_arg(const std::vector<std::string>& args);

}
