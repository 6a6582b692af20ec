#pragma once
#include "ByteSource.h"
#include "EventHandler.h"
#include "Execution.h"
#include <functional>
#include <memory>
#include <string>

namespace testsum {

// Splits a byte stream into lines without the trailing '\n'. The sequence of
// lines produced does not depend on how the input is chunked.
class LineSplitter {
public:
    using LineFn = std::function<void(std::string)>;

    void feed(const char* data, std::size_t len, const LineFn& on_line);
    // Emits a final unterminated line, if any.
    void finish(const LineFn& on_line);
private:
    std::string pending_;
};

// Reads src to exhaustion, calling on_line for each line.
void read_lines(ByteSource& src, const LineSplitter::LineFn& on_line);

struct ScanConfig {
    ByteSource& stdout_source;
    ByteSource& stderr_source;
    EventHandler& handler;
    // Invoked when one stream fails, to unblock the reader of the other.
    std::function<void()> cancel;
};

// Consumes both streams concurrently. stdout lines are decoded as test events
// and delivered in order; stderr lines are delivered as they arrive. The first
// decode or handler failure aborts the scan and is rethrown.
std::shared_ptr<Execution> scan_test_output(const ScanConfig& cfg);

}
