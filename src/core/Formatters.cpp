#include "Formatters.h"
#include <cstdio>

namespace testsum {

namespace {

std::string dots_format(const TestEvent& ev, const Execution&, const Colorizer& c){
    if(ev.package_event()) return "";
    switch(ev.action){
        case Action::Pass: return "·";
        case Action::Skip: return c.yellow("↷");
        case Action::Fail: return c.red("✖");
        default: return "";
    }
}

std::string package_line(const TestEvent& ev, const Execution& exec, const Colorizer& c){
    if(!ev.package_event()) return "";
    Package pkg = exec.package(ev.package);
    std::string suffix;
    if(pkg.cached) suffix = " (cached)";
    else if(ev.elapsed > 0) suffix = " (" + format_elapsed(ev.elapsed) + ")";
    if(!pkg.coverage.empty()) suffix += " (" + pkg.coverage + ")";

    switch(ev.action){
        case Action::Pass:
            return c.green("✓") + "  " + ev.package + suffix + "\n";
        case Action::Fail:
            return c.red("✖") + "  " + ev.package + suffix + "\n";
        case Action::Skip:
            if(pkg.total == 0) return "∅  " + ev.package + "\n";
            return c.yellow("↷") + "  " + ev.package + "\n";
        default:
            return "";
    }
}

std::string short_verbose_format(const TestEvent& ev, const Execution& exec, const Colorizer& c){
    if(ev.package_event()) return package_line(ev, exec, c);
    std::string name = ev.package + "." + ev.test;
    char elapsed[32];
    std::snprintf(elapsed, sizeof(elapsed), " (%.2fs)", ev.elapsed);
    switch(ev.action){
        case Action::Pass: return "PASS " + name + elapsed + "\n";
        case Action::Skip: return c.yellow("SKIP") + " " + name + "\n";
        case Action::Fail: return c.red("FAIL") + " " + name + elapsed + "\n";
        default: return "";
    }
}

std::string standard_quiet_format(const TestEvent& ev, const Execution&){
    if(ev.package_event() && ev.action == Action::Output) return ev.output;
    return "";
}

std::string standard_verbose_format(const TestEvent& ev, const Execution&){
    if(ev.action == Action::Output) return ev.output;
    return "";
}

}

const std::vector<FormatInfo>& known_formats(){
    static const std::vector<FormatInfo> formats = {
        {"dots", "print a character for each test"},
        {"short", "print a line for each package"},
        {"short-verbose", "print a line for each test and package"},
        {"standard-quiet", "default go test format"},
        {"standard-verbose", "default go test -v format"},
    };
    return formats;
}

EventFormatter new_formatter(const std::string& name, const Colorizer& color){
    if(name == "dots") return [color](const TestEvent& ev, const Execution& ex){ return dots_format(ev, ex, color); };
    if(name == "short") return [color](const TestEvent& ev, const Execution& ex){ return package_line(ev, ex, color); };
    if(name == "short-verbose") return [color](const TestEvent& ev, const Execution& ex){ return short_verbose_format(ev, ex, color); };
    if(name == "standard-quiet") return standard_quiet_format;
    if(name == "standard-verbose") return standard_verbose_format;
    return {};
}

std::string format_elapsed(double seconds){
    char buf[32];
    if(seconds < 1.0) std::snprintf(buf, sizeof(buf), "%dms", static_cast<int>(seconds * 1000.0 + 0.5));
    else std::snprintf(buf, sizeof(buf), "%.3fs", seconds);
    return buf;
}

}
