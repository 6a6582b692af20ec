#pragma once
#include "TestEvent.h"
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace testsum {

struct TestCase {
    std::string package;
    std::string test;
    double elapsed = 0.0;
};

// Aggregate state of one package, built from its events.
struct Package {
    int total = 0;
    std::vector<TestCase> passed;
    std::vector<TestCase> failed;
    std::vector<TestCase> skipped;
    std::map<std::string, std::vector<std::string>> output; // test name ("" = package) -> lines
    Action action = Action::Unknown; // final package action, Unknown while running
    double elapsed = 0.0;
    bool cached = false;
    std::string coverage;

    const std::vector<std::string>& output_of(const std::string& test) const;
};

// Everything observed during one run. Events arrive from the stdout reader and
// error lines from the stderr reader, so every accessor locks and returns a copy.
class Execution {
public:
    Execution();

    void add(const TestEvent& event);
    void add_error(const std::string& line);

    std::map<std::string, Package> packages() const;
    bool has_package(const std::string& name) const;
    Package package(const std::string& name) const;
    std::vector<std::string> errors() const;

    int total() const;
    std::vector<TestCase> failed() const;
    std::vector<TestCase> skipped() const;
    std::vector<std::string> output(const std::string& pkg, const std::string& test) const;

    std::chrono::steady_clock::duration elapsed() const;
    std::chrono::system_clock::time_point started() const { return started_wall_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Package> packages_;
    std::vector<std::string> errors_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::system_clock::time_point started_wall_;
};

}
