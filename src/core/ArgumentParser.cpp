#include "ArgumentParser.h"
#include "Formatters.h"
#include "BuildInfo.h" // generated by CMake
#include <iomanip>

namespace testsum {

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out;
    std::string cur;
    for(char c : s){
        if(c == ','){
            if(!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

namespace {
    bool parse_bool(const std::string& v, bool& out){
        if(v == "true" || v == "1" || v == "t" || v == "TRUE" || v == "True"){ out = true; return true; }
        if(v == "false" || v == "0" || v == "f" || v == "FALSE" || v == "False"){ out = false; return true; }
        return false;
    }
}

ArgumentParser::ArgumentParser(std::string program, std::ostream& out, std::ostream& err)
    : program_(std::move(program)), out_(out), err_(err) {
    specs_ = {
        {"--debug", ArgKind::Bool, "enabled debug", [](RunOptions& o, const std::string& v){ o.debug = v == "true"; }},
        {"--format", ArgKind::String, "print format of test input", [](RunOptions& o, const std::string& v){ o.format = v; }},
        {"--raw-command", ArgKind::Bool, "don't prepend 'go test -json' to the 'go test' command", [](RunOptions& o, const std::string& v){ o.raw_command = v == "true"; }},
        {"--jsonfile", ArgKind::String, "write all TestEvents to file", [](RunOptions& o, const std::string& v){ o.json_file = v; }},
        {"--junitfile", ArgKind::String, "write a JUnit XML file", [](RunOptions& o, const std::string& v){ o.junit_file = v; }},
        {"--no-color", ArgKind::Bool, "disable color output", [](RunOptions& o, const std::string& v){ o.no_color = v == "true"; }},
        {"--no-summary", ArgKind::CSV, "do not print summary of: failed, skipped, errors", [](RunOptions& o, const std::string& v){
            auto items = split_csv(v);
            o.no_summary.insert(o.no_summary.end(), items.begin(), items.end());
        }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& name) const {
    for(const auto& s : specs_) if(name == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::fail(const std::string& msg){
    error_ = msg;
    exit_code_ = 1;
    err_ << msg << "\n";
    print_usage(err_);
    return false;
}

bool ArgumentParser::parse(int argc, char** argv, RunOptions& opts){
    exit_code_ = 0;
    error_.clear();
    int i = 1;
    for(; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--"){ ++i; break; }
        if(a.size() < 2 || a[0] != '-') break; // first positional ends flag parsing
        if(a == "--help" || a == "-h"){ print_usage(out_); return false; }
        if(a == "--version"){ print_version(out_); return false; }

        std::string name = a;
        std::string value;
        bool has_value = false;
        auto eq = a.find('=');
        if(eq != std::string::npos && a.rfind("--", 0) == 0){
            name = a.substr(0, eq);
            value = a.substr(eq + 1);
            has_value = true;
        }
        const FlagSpec* spec = find_spec(name);
        if(!spec) return fail("unknown flag: " + name);

        switch(spec->kind){
            case ArgKind::Bool: {
                bool b = true;
                if(has_value && !parse_bool(value, b)) return fail("invalid argument \"" + value + "\" for \"" + name + "\" flag");
                value = b ? "true" : "false";
                break;
            }
            case ArgKind::String:
            case ArgKind::CSV:
                if(!has_value){
                    if(i + 1 >= argc) return fail("flag needs an argument: " + name);
                    value = argv[++i];
                }
                break;
        }
        spec->apply(opts, value);
    }
    opts.args.assign(argv + i, argv + argc);
    return true;
}

void ArgumentParser::print_usage(std::ostream& os) const {
    os << "Usage:\n    " << program_ << " [flags] [--] [go test flags]\n\nFlags:\n";
    for(const auto& s : specs_){
        std::string name = std::string("      ") + s.name;
        if(s.kind == ArgKind::String) name += " string";
        if(s.kind == ArgKind::CSV) name += " strings";
        os << std::left << std::setw(32) << name << s.help << "\n";
    }
    os << std::left << std::setw(32) << "      --version" << "print version and exit\n";
    os << "\nFormats:\n";
    for(const auto& f : known_formats()){
        os << "    " << std::left << std::setw(18) << f.name << f.description << "\n";
    }
    os << "\nEnvironment:\n";
    auto env_line = [&os](const std::string& names, const char* help){
        os << "    " << std::left << std::setw(44) << names << help << "\n";
    };
    env_line(std::string(kEnvFormat) + " (or " + kEnvFormatCompat + ")", "default for --format");
    env_line(std::string(kEnvJsonFile) + " (or " + kEnvJsonFileCompat + ")", "default for --jsonfile");
    env_line(std::string(kEnvJUnitFile) + " (or " + kEnvJUnitFileCompat + ")", "default for --junitfile");
    env_line(kEnvTestDirectory, "package path appended to the go test command");
}

void ArgumentParser::print_version(std::ostream& os) const {
    os << program_ << " " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
       << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
       << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
