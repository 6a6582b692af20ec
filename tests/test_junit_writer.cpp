#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/JUnitWriter.h"
#include "../src/core/Errors.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace testsum {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

class JUnitWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / ("testsum_junit_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    void add(Action action, const std::string& pkg, const std::string& test, double elapsed = 0, const std::string& output = ""){
        TestEvent ev;
        ev.action = action;
        ev.package = pkg;
        ev.test = test;
        ev.elapsed = elapsed;
        ev.output = output;
        exec.add(ev);
    }

    static std::string read(const fs::path& p){
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path temp_dir;
    Execution exec;
};

TEST_F(JUnitWriterTest, EmptyExecution) {
    std::string xml = junit_xml(exec);
    EXPECT_THAT(xml, StartsWith("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<testsuites>\n"));
    EXPECT_THAT(xml, HasSubstr("</testsuites>\n"));
    EXPECT_THAT(xml, Not(HasSubstr("<testsuite ")));
}

TEST_F(JUnitWriterTest, SuitePerPackageWithCases) {
    add(Action::Run, "example.com/a", "TestOK");
    add(Action::Pass, "example.com/a", "TestOK", 0.5);
    add(Action::Run, "example.com/a", "TestBad");
    add(Action::Output, "example.com/a", "TestBad", 0, "    bad_test.go:3: got <nil>\n");
    add(Action::Fail, "example.com/a", "TestBad", 0.25);
    add(Action::Run, "example.com/a", "TestLater");
    add(Action::Output, "example.com/a", "TestLater", 0, "    later_test.go:9: skipping\n");
    add(Action::Skip, "example.com/a", "TestLater");
    add(Action::Fail, "example.com/a", "", 1.25);

    std::string xml = junit_xml(exec);
    EXPECT_THAT(xml, HasSubstr("<testsuite tests=\"3\" failures=\"1\" errors=\"0\" skipped=\"1\" time=\"1.250000\" name=\"example.com/a\""));
    EXPECT_THAT(xml, HasSubstr("<testcase classname=\"example.com/a\" name=\"TestOK\" time=\"0.500000\"></testcase>"));
    EXPECT_THAT(xml, HasSubstr("name=\"TestBad\" time=\"0.250000\">\n\t\t\t<failure message=\"Failed\" type=\"\">    bad_test.go:3: got &lt;nil&gt;\n</failure>"));
    EXPECT_THAT(xml, HasSubstr("<skipped message=\"    later_test.go:9: skipping\n\"></skipped>"));
    EXPECT_THAT(xml, Not(HasSubstr("TestMain")));
}

TEST_F(JUnitWriterTest, PackageFailureWithoutTestFailure) {
    add(Action::Output, "example.com/b", "", 0, "panic: init failed\n");
    add(Action::Fail, "example.com/b", "", 0.1);
    std::string xml = junit_xml(exec);
    EXPECT_THAT(xml, HasSubstr("tests=\"1\" failures=\"1\""));
    EXPECT_THAT(xml, HasSubstr("name=\"TestMain\""));
    EXPECT_THAT(xml, HasSubstr("panic: init failed"));
}

TEST_F(JUnitWriterTest, WritesFile) {
    add(Action::Run, "p", "T");
    add(Action::Pass, "p", "T");
    fs::path out = temp_dir / "junit.xml";
    {
        std::ofstream stale(out);
        stale << "stale content that is longer than nothing";
    }
    write_junit_file(out.string(), exec);
    EXPECT_EQ(read(out), junit_xml(exec));
}

TEST_F(JUnitWriterTest, EmptyPathWritesNothing) {
    EXPECT_NO_THROW(write_junit_file("", exec));
    EXPECT_TRUE(fs::is_empty(temp_dir));
}

TEST_F(JUnitWriterTest, UnwritablePathThrows) {
    fs::path out = temp_dir / "missing" / "junit.xml";
    EXPECT_THROW(write_junit_file(out.string(), exec), ReportError);
}

} // namespace testsum
