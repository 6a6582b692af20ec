#pragma once
#include "Config.h"
#include "Execution.h"
#include "Formatters.h"
#include "Logging.h"
#include "TestEvent.h"
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace testsum {

// Receives decoded stdout events and raw stderr lines. Called concurrently from
// the stdout and stderr readers; implementations serialise shared state.
// Throwing from either method aborts the scan.
class EventHandler {
public:
    virtual ~EventHandler() = default;
    virtual void event(const TestEvent& ev, const Execution& exec) = 0;
    virtual void err(const std::string& line) = 0;
    virtual void close() {}
};

using EventHandlerPtr = std::unique_ptr<EventHandler>;

// Prints formatted events to out, stderr lines to err, and optionally copies
// every raw event line to a capture file.
class FormattingEventHandler : public EventHandler {
public:
    FormattingEventHandler(EventFormatter formatter, std::ostream& out, std::ostream& err,
                           std::unique_ptr<std::ofstream> json_file, std::string json_path);
    ~FormattingEventHandler() override;

    void event(const TestEvent& ev, const Execution& exec) override;
    void err(const std::string& line) override;
    void close() override;

private:
    EventFormatter formatter_;
    std::ostream& out_;
    std::ostream& err_;
    std::unique_ptr<std::ofstream> json_file_;
    std::string json_path_;
    std::mutex mutex_;
};

// Throws RunError for an unknown format or an unwritable --jsonfile.
EventHandlerPtr new_event_handler(const RunOptions& opts, std::ostream& out, std::ostream& err, Logger& log);

}
