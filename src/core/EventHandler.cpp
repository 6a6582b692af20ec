#include "EventHandler.h"
#include "Errors.h"
#include <cerrno>
#include <cstring>

namespace testsum {

FormattingEventHandler::FormattingEventHandler(EventFormatter formatter, std::ostream& out, std::ostream& err,
                                               std::unique_ptr<std::ofstream> json_file, std::string json_path)
    : formatter_(std::move(formatter)), out_(out), err_(err),
      json_file_(std::move(json_file)), json_path_(std::move(json_path)) {}

FormattingEventHandler::~FormattingEventHandler(){
    if(json_file_ && json_file_->is_open()) json_file_->close();
}

void FormattingEventHandler::event(const TestEvent& ev, const Execution& exec){
    std::string line = formatter_ ? formatter_(ev, exec) : std::string();
    std::lock_guard<std::mutex> lock(mutex_);
    if(json_file_){
        *json_file_ << ev.raw << '\n';
        if(!*json_file_) throw ReportError("failed to write JSON file " + json_path_);
    }
    if(!line.empty()){
        out_ << line;
        out_.flush();
        if(!out_) throw ReportError("failed to write test output");
    }
}

void FormattingEventHandler::err(const std::string& line){
    std::lock_guard<std::mutex> lock(mutex_);
    err_ << line << '\n';
    err_.flush();
}

void FormattingEventHandler::close(){
    std::lock_guard<std::mutex> lock(mutex_);
    if(!json_file_ || !json_file_->is_open()) return;
    json_file_->close();
    if(json_file_->fail()) throw ReportError("failed to close JSON file " + json_path_);
}

EventHandlerPtr new_event_handler(const RunOptions& opts, std::ostream& out, std::ostream& err, Logger& log){
    EventFormatter formatter = new_formatter(opts.format, Colorizer(!opts.no_color));
    if(!formatter) throw RunError("unknown format " + opts.format);

    std::unique_ptr<std::ofstream> json_file;
    if(!opts.json_file.empty()){
        json_file = std::make_unique<std::ofstream>(opts.json_file, std::ios::out | std::ios::trunc);
        if(!json_file->is_open()){
            throw RunError("failed to open JSON file " + opts.json_file + ": " + std::strerror(errno));
        }
        log.debug("writing test events to " + opts.json_file);
    }
    return std::make_unique<FormattingEventHandler>(std::move(formatter), out, err, std::move(json_file), opts.json_file);
}

}
