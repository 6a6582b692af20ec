#pragma once
#include "Config.h"
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace testsum {

// Parses testsum flags into RunOptions. Parsing stops at the first positional
// argument or "--"; everything after it belongs to the test command.
class ArgumentParser {
public:
    explicit ArgumentParser(std::string program = "testsum", std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Returns false when the program should exit now (help, version, bad
    // flag); exit_code() then holds the status to exit with.
    bool parse(int argc, char** argv, RunOptions& opts);
    int exit_code() const { return exit_code_; }
    const std::string& error() const { return error_; }

    void print_usage(std::ostream& os) const;
    void print_version(std::ostream& os) const;

private:
    enum class ArgKind { Bool, String, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<void(RunOptions&, const std::string&)> apply;
    };

    const FlagSpec* find_spec(const std::string& name) const;
    bool fail(const std::string& msg);

    std::string program_;
    std::ostream& out_;
    std::ostream& err_;
    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    std::string error_;
};

std::vector<std::string> split_csv(const std::string& s);

}
