#include "TestEvent.h"
#include "Errors.h"
#include <nlohmann/json.hpp>

namespace testsum {

Action action_from_string(const std::string& s){
    if(s == "run") return Action::Run;
    if(s == "pause") return Action::Pause;
    if(s == "cont") return Action::Cont;
    if(s == "pass") return Action::Pass;
    if(s == "bench") return Action::Bench;
    if(s == "fail") return Action::Fail;
    if(s == "output") return Action::Output;
    if(s == "skip") return Action::Skip;
    return Action::Unknown;
}

const char* action_name(Action a){
    switch(a){
        case Action::Run: return "run";
        case Action::Pause: return "pause";
        case Action::Cont: return "cont";
        case Action::Pass: return "pass";
        case Action::Bench: return "bench";
        case Action::Fail: return "fail";
        case Action::Output: return "output";
        case Action::Skip: return "skip";
        case Action::Unknown: break;
    }
    return "unknown";
}

namespace {
    std::string string_field(const nlohmann::json& j, const char* key){
        auto it = j.find(key);
        if(it == j.end() || it->is_null()) return "";
        if(!it->is_string()) throw DecodeError(std::string("field ") + key + " is not a string");
        return it->get<std::string>();
    }
}

TestEvent decode_event(const std::string& line){
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch(const nlohmann::json::parse_error& e) {
        throw DecodeError("failed to parse test output: " + line + ": " + e.what());
    }
    if(!j.is_object()) throw DecodeError("failed to parse test output: " + line + ": not a JSON object");

    TestEvent ev;
    try {
        ev.time = string_field(j, "Time");
        ev.action = action_from_string(string_field(j, "Action"));
        ev.package = string_field(j, "Package");
        ev.test = string_field(j, "Test");
        ev.output = string_field(j, "Output");
        auto el = j.find("Elapsed");
        if(el != j.end() && !el->is_null()){
            if(!el->is_number()) throw DecodeError("field Elapsed is not a number");
            ev.elapsed = el->get<double>();
        }
    } catch(const DecodeError& e) {
        throw DecodeError("failed to parse test output: " + line + ": " + e.what());
    }
    ev.raw = line;
    return ev;
}

}
