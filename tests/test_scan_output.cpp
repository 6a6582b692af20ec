#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/ScanOutput.h"
#include "../src/core/Errors.h"
#include <condition_variable>
#include <mutex>
#include <stdexcept>

namespace testsum {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Throw;

class MockEventHandler : public EventHandler {
public:
    MOCK_METHOD(void, event, (const TestEvent& ev, const Execution& exec), (override));
    MOCK_METHOD(void, err, (const std::string& line), (override));
};

class RecordingHandler : public EventHandler {
public:
    void event(const TestEvent& ev, const Execution&) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(ev.raw);
    }
    void err(const std::string& line) override {
        std::lock_guard<std::mutex> lock(mutex);
        errors.push_back(line);
    }
    std::mutex mutex;
    std::vector<std::string> events;
    std::vector<std::string> errors;
};

// Blocks in read() until released, like a pipe whose writer never closes.
class BlockingSource : public ByteSource {
public:
    std::size_t read(char*, std::size_t) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]{ return released_; });
        return 0;
    }
    void release(){
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }
private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
};

class ScanOutputTest : public ::testing::Test {
protected:
    static std::string event_line(const std::string& action, const std::string& test, const std::string& output = ""){
        std::string line = "{\"Time\":\"2024-01-02T03:04:05Z\",\"Action\":\"" + action + "\",\"Package\":\"example.com/pkg\"";
        if(!test.empty()) line += ",\"Test\":\"" + test + "\"";
        if(!output.empty()) line += ",\"Output\":\"" + output + "\"";
        return line + "}";
    }

    std::string stream_of(int tests){
        std::string s;
        for(int i = 0; i < tests; ++i){
            std::string name = "Test" + std::to_string(i);
            lines.push_back(event_line("run", name));
            lines.push_back(event_line("output", name, "=== RUN   " + name + "\\n"));
            lines.push_back(event_line(i % 3 == 0 ? "fail" : "pass", name));
        }
        lines.push_back(event_line("pass", ""));
        for(const auto& l : lines) s += l + "\n";
        return s;
    }

    std::vector<std::string> lines;
};

TEST(LineSplitterTest, SplitsAcrossChunks) {
    LineSplitter splitter;
    std::vector<std::string> got;
    auto collect = [&](std::string l){ got.push_back(std::move(l)); };
    splitter.feed("ab", 2, collect);
    splitter.feed("c\nde", 4, collect);
    splitter.feed("\n\nf", 3, collect);
    splitter.finish(collect);
    EXPECT_THAT(got, ElementsAre("abc", "de", "", "f"));
}

TEST(LineSplitterTest, NoTrailingLineAfterFinalNewline) {
    LineSplitter splitter;
    std::vector<std::string> got;
    auto collect = [&](std::string l){ got.push_back(std::move(l)); };
    splitter.feed("x\n", 2, collect);
    splitter.finish(collect);
    EXPECT_THAT(got, ElementsAre("x"));
}

TEST_F(ScanOutputTest, DeliversEventsInStreamOrder) {
    StringSource out(stream_of(5));
    StringSource err("");
    RecordingHandler handler;
    auto exec = scan_test_output(ScanConfig{out, err, handler, nullptr});
    EXPECT_EQ(handler.events, lines);
    EXPECT_EQ(exec->total(), 5);
    EXPECT_EQ(exec->failed().size(), 2u);
}

TEST_F(ScanOutputTest, ChunkBoundariesDoNotChangeEvents) {
    std::string data = stream_of(7);
    std::vector<std::string> expected = lines;
    for(std::size_t chunk : {1u, 2u, 3u, 7u, 13u, 64u, 100000u}){
        StringSource out(data, chunk);
        StringSource err("");
        RecordingHandler handler;
        scan_test_output(ScanConfig{out, err, handler, nullptr});
        EXPECT_EQ(handler.events, expected) << "chunk size " << chunk;
    }
}

TEST_F(ScanOutputTest, StderrLinesBecomeErrors) {
    StringSource out(event_line("pass", "") + "\n");
    StringSource err("# example.com/pkg\n./x.go:1: syntax error", 5);
    RecordingHandler handler;
    auto exec = scan_test_output(ScanConfig{out, err, handler, nullptr});
    EXPECT_THAT(handler.errors, ElementsAre("# example.com/pkg", "./x.go:1: syntax error"));
    EXPECT_THAT(exec->errors(), ElementsAre("# example.com/pkg", "./x.go:1: syntax error"));
}

TEST_F(ScanOutputTest, BlankStdoutLinesAreSkipped) {
    StringSource out("\n" + event_line("run", "TestA") + "\n  \n");
    StringSource err("");
    MockEventHandler handler;
    EXPECT_CALL(handler, event(Field(&TestEvent::test, "TestA"), _)).Times(1);
    scan_test_output(ScanConfig{out, err, handler, nullptr});
}

TEST_F(ScanOutputTest, HandlerSeesAggregateIncludingCurrentEvent) {
    StringSource out(event_line("run", "TestA") + "\n");
    StringSource err("");
    MockEventHandler handler;
    EXPECT_CALL(handler, event(_, _)).WillOnce([](const TestEvent&, const Execution& exec){
        EXPECT_EQ(exec.total(), 1);
    });
    scan_test_output(ScanConfig{out, err, handler, nullptr});
}

TEST_F(ScanOutputTest, DecodeErrorAbortsScan) {
    StringSource out(event_line("run", "TestA") + "\nnot json\n" + event_line("pass", "TestA") + "\n");
    StringSource err("");
    MockEventHandler handler;
    {
        InSequence seq;
        EXPECT_CALL(handler, event(Field(&TestEvent::action, Action::Run), _)).Times(1);
    }
    bool cancelled = false;
    EXPECT_THROW(scan_test_output(ScanConfig{out, err, handler, [&]{ cancelled = true; }}), DecodeError);
    EXPECT_TRUE(cancelled);
}

TEST_F(ScanOutputTest, DecodeErrorUnblocksStderrReader) {
    StringSource out("{broken\n");
    BlockingSource err;
    RecordingHandler handler;
    EXPECT_THROW(scan_test_output(ScanConfig{out, err, handler, [&]{ err.release(); }}), DecodeError);
}

TEST_F(ScanOutputTest, HandlerExceptionAbortsScan) {
    StringSource out(stream_of(2));
    StringSource err("");
    MockEventHandler handler;
    EXPECT_CALL(handler, event(_, _)).WillOnce(Throw(std::runtime_error("handler failed")));
    EXPECT_THROW(scan_test_output(ScanConfig{out, err, handler, nullptr}), std::runtime_error);
}

TEST_F(ScanOutputTest, StderrHandlerExceptionIsRethrown) {
    BlockingSource out;
    StringSource err("boom\n");
    MockEventHandler handler;
    EXPECT_CALL(handler, err("boom")).WillOnce(Throw(ReportError("cannot write")));
    EXPECT_THROW(scan_test_output(ScanConfig{out, err, handler, [&]{ out.release(); }}), ReportError);
}

} // namespace testsum
