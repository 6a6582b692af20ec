#include "core/TestEvent.h"
#include "core/Execution.h"
#include "core/Errors.h"
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string line(reinterpret_cast<const char*>(data), size);

    testsum::Execution exec;
    try {
        exec.add(testsum::decode_event(line));
    } catch (const testsum::DecodeError&) {
        // malformed lines are expected input
    }
    return 0;
}
