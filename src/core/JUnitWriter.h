#pragma once
#include "Execution.h"
#include <string>

namespace testsum {

// JUnit XML document for exec: one <testsuite> per package.
std::string junit_xml(const Execution& exec);

// Writes junit_xml(exec) to path, replacing any existing file. Does nothing
// for an empty path. Throws ReportError.
void write_junit_file(const std::string& path, const Execution& exec);

}
