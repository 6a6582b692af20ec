#include "Config.h"
#include <cstdlib>

namespace testsum {

EnvLookup process_env(){
    return [](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if(!v) return std::nullopt;
        return std::string(v);
    };
}

std::string lookup_env_with_default(const EnvLookup& env, const std::string& key, const std::string& def){
    if(!env) return def;
    if(auto v = env(key)) return *v;
    return def;
}

RunOptions default_options(const EnvLookup& env){
    auto either = [&env](const char* key, const char* compat, const std::string& def){
        return lookup_env_with_default(env, key, lookup_env_with_default(env, compat, def));
    };
    RunOptions opts;
    opts.format = either(kEnvFormat, kEnvFormatCompat, kDefaultFormat);
    opts.json_file = either(kEnvJsonFile, kEnvJsonFileCompat, "");
    opts.junit_file = either(kEnvJUnitFile, kEnvJUnitFileCompat, "");
    return opts;
}

}
