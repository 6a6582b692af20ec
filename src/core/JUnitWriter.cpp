#include "JUnitWriter.h"
#include "Errors.h"
#include "XmlUtil.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

namespace testsum {

namespace {
    using xmlutil::escape;

    std::string seconds(double s){
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.6f", s);
        return buf;
    }

    std::string joined_output(const Package& pkg, const std::string& test){
        std::string out;
        for(const auto& line : pkg.output_of(test)) out += line;
        return out;
    }

    void write_case_open(std::ostream& os, const std::string& pkg, const std::string& test, double elapsed){
        os << "\t\t<testcase classname=\"" << escape(pkg) << "\" name=\"" << escape(test)
           << "\" time=\"" << seconds(elapsed) << "\"";
    }
}

std::string junit_xml(const Execution& exec){
    std::ostringstream os;
    const std::string timestamp = xmlutil::time_to_iso(exec.started());
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<testsuites>\n";
    for(const auto& kv : exec.packages()){
        const std::string& name = kv.first;
        const Package& pkg = kv.second;
        bool package_failure = pkg.action == Action::Fail && pkg.failed.empty();
        std::size_t failures = pkg.failed.size() + (package_failure ? 1 : 0);
        std::size_t tests = pkg.passed.size() + pkg.failed.size() + pkg.skipped.size() + (package_failure ? 1 : 0);

        os << "\t<testsuite tests=\"" << tests << "\" failures=\"" << failures
           << "\" errors=\"0\" skipped=\"" << pkg.skipped.size()
           << "\" time=\"" << seconds(pkg.elapsed) << "\" name=\"" << escape(name)
           << "\" timestamp=\"" << timestamp << "\">\n";

        for(const auto& tc : pkg.passed){
            write_case_open(os, name, tc.test, tc.elapsed);
            os << "></testcase>\n";
        }
        for(const auto& tc : pkg.failed){
            write_case_open(os, name, tc.test, tc.elapsed);
            os << ">\n\t\t\t<failure message=\"Failed\" type=\"\">" << escape(joined_output(pkg, tc.test)) << "</failure>\n\t\t</testcase>\n";
        }
        for(const auto& tc : pkg.skipped){
            write_case_open(os, name, tc.test, tc.elapsed);
            os << ">\n\t\t\t<skipped message=\"" << escape(joined_output(pkg, tc.test)) << "\"></skipped>\n\t\t</testcase>\n";
        }
        // Build failures and panics outside any test fail the package only.
        if(package_failure){
            write_case_open(os, name, "TestMain", pkg.elapsed);
            os << ">\n\t\t\t<failure message=\"Failed\" type=\"\">" << escape(joined_output(pkg, "")) << "</failure>\n\t\t</testcase>\n";
        }
        os << "\t</testsuite>\n";
    }
    os << "</testsuites>\n";
    return os.str();
}

void write_junit_file(const std::string& path, const Execution& exec){
    if(path.empty()) return;
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if(!ofs) throw ReportError("failed to open JUnit file " + path + ": " + std::strerror(errno));
    ofs << junit_xml(exec);
    ofs.close();
    if(ofs.fail()) throw ReportError("failed to write JUnit file " + path);
}

}
