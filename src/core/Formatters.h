#pragma once
#include "Execution.h"
#include "TestEvent.h"
#include <functional>
#include <string>
#include <vector>

namespace testsum {

// ANSI colouring, disabled by --no-color. Passed by value to whoever needs it.
class Colorizer {
public:
    explicit Colorizer(bool enabled = true) : enabled_(enabled) {}
    bool enabled() const { return enabled_; }
    std::string red(const std::string& s) const { return wrap("\x1b[31m", s); }
    std::string green(const std::string& s) const { return wrap("\x1b[32m", s); }
    std::string yellow(const std::string& s) const { return wrap("\x1b[33m", s); }
    std::string magenta(const std::string& s) const { return wrap("\x1b[35m", s); }
    std::string bold(const std::string& s) const { return wrap("\x1b[1m", s); }
private:
    std::string wrap(const char* code, const std::string& s) const {
        return enabled_ ? std::string(code) + s + "\x1b[0m" : s;
    }
    bool enabled_;
};

// Renders one event; an empty string prints nothing.
using EventFormatter = std::function<std::string(const TestEvent&, const Execution&)>;

struct FormatInfo {
    const char* name;
    const char* description;
};

const std::vector<FormatInfo>& known_formats();

// Returns an empty function for an unknown name.
EventFormatter new_formatter(const std::string& name, const Colorizer& color);

std::string format_elapsed(double seconds);

}
