#pragma once
#include <string>

namespace testsum {

enum class Action { Run, Pause, Cont, Pass, Bench, Fail, Output, Skip, Unknown };

Action action_from_string(const std::string& s);
const char* action_name(Action a);

// One line of "go test -json" output.
struct TestEvent {
    std::string time; // RFC3339, as emitted
    Action action = Action::Unknown;
    std::string package;
    std::string test;
    double elapsed = 0.0; // seconds
    std::string output;
    std::string raw; // the undecoded line

    // Events without a test name describe the package as a whole.
    bool package_event() const { return test.empty(); }
};

// Decodes one JSON line. Throws DecodeError on malformed input.
TestEvent decode_event(const std::string& line);

}
