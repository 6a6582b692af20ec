#include "CommandBuilder.h"
#include <algorithm>

namespace testsum {

namespace {
    const std::vector<std::string> kBaseCommand = {"go", "test"};
    const char* kJsonFlag = "-json";

    std::string path_from_env(const EnvLookup& env, const std::string& def){
        return lookup_env_with_default(env, kEnvTestDirectory, def);
    }
}

bool has_json_arg(const std::vector<std::string>& args){
    return std::any_of(args.begin(), args.end(), [](const std::string& a){ return a == "-json" || a == "--json"; });
}

std::vector<std::string> compose_test_command(const RunOptions& opts, const EnvLookup& env){
    if(opts.raw_command) return opts.args;

    std::vector<std::string> cmd = kBaseCommand;
    if(opts.args.empty()){
        cmd.push_back(kJsonFlag);
        cmd.push_back(path_from_env(env, kDefaultTestPath));
        return cmd;
    }
    if(!has_json_arg(opts.args)) cmd.push_back(kJsonFlag);
    cmd.insert(cmd.end(), opts.args.begin(), opts.args.end());
    std::string test_path = path_from_env(env, "");
    if(!test_path.empty()) cmd.push_back(test_path);
    return cmd;
}

}
