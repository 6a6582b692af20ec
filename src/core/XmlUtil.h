#pragma once
#include <chrono>
#include <string>

namespace testsum {
namespace xmlutil {

// Escapes text for use in XML content and attribute values. Control
// characters not allowed in XML 1.0 are dropped.
std::string escape(const std::string& s);

// UTC timestamp without fractional seconds, e.g. 2024-01-02T03:04:05.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
