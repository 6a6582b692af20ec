#include "ScanOutput.h"
#include <array>
#include <exception>
#include <thread>

namespace testsum {

void LineSplitter::feed(const char* data, std::size_t len, const LineFn& on_line){
    std::size_t start = 0;
    for(std::size_t i = 0; i < len; ++i){
        if(data[i] != '\n') continue;
        pending_.append(data + start, i - start);
        std::string line;
        line.swap(pending_);
        on_line(std::move(line));
        start = i + 1;
    }
    pending_.append(data + start, len - start);
}

void LineSplitter::finish(const LineFn& on_line){
    if(pending_.empty()) return;
    std::string line;
    line.swap(pending_);
    on_line(std::move(line));
}

void read_lines(ByteSource& src, const LineSplitter::LineFn& on_line){
    LineSplitter splitter;
    std::array<char, 65536> buf;
    while(true){
        std::size_t n = src.read(buf.data(), buf.size());
        if(n == 0) break;
        splitter.feed(buf.data(), n, on_line);
    }
    splitter.finish(on_line);
}

namespace {
    bool blank(const std::string& s){
        return s.find_first_not_of(" \t\r") == std::string::npos;
    }
}

std::shared_ptr<Execution> scan_test_output(const ScanConfig& cfg){
    auto exec = std::make_shared<Execution>();

    std::exception_ptr stderr_failure;
    std::thread stderr_reader([&](){
        try {
            read_lines(cfg.stderr_source, [&](std::string line){
                exec->add_error(line);
                cfg.handler.err(line);
            });
        } catch(...) {
            stderr_failure = std::current_exception();
            if(cfg.cancel) cfg.cancel();
        }
    });

    std::exception_ptr stdout_failure;
    try {
        read_lines(cfg.stdout_source, [&](std::string line){
            if(blank(line)) return;
            TestEvent ev = decode_event(line);
            exec->add(ev);
            cfg.handler.event(ev, *exec);
        });
    } catch(...) {
        stdout_failure = std::current_exception();
        if(cfg.cancel) cfg.cancel();
    }
    stderr_reader.join();

    if(stdout_failure) std::rethrow_exception(stdout_failure);
    if(stderr_failure) std::rethrow_exception(stderr_failure);
    return exec;
}

}
