#include "Execution.h"

namespace testsum {

namespace {
    const std::vector<std::string> kNoOutput;

    std::string strip_newline(std::string s){
        while(!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        return s;
    }
}

const std::vector<std::string>& Package::output_of(const std::string& test) const {
    auto it = output.find(test);
    return it == output.end() ? kNoOutput : it->second;
}

Execution::Execution()
    : started_(std::chrono::steady_clock::now()), started_wall_(std::chrono::system_clock::now()) {}

void Execution::add(const TestEvent& ev){
    std::lock_guard<std::mutex> lock(mutex_);
    Package& pkg = packages_[ev.package];

    if(ev.package_event()){
        switch(ev.action){
            case Action::Output: {
                pkg.output[""].push_back(ev.output);
                if(ev.output.find("\t(cached)") != std::string::npos) pkg.cached = true;
                auto cov = ev.output.find("coverage: ");
                if(cov != std::string::npos && ev.output.find(" of statements") != std::string::npos){
                    pkg.coverage = strip_newline(ev.output.substr(cov));
                    auto tab = pkg.coverage.find('\t');
                    if(tab != std::string::npos) pkg.coverage.erase(tab);
                }
                break;
            }
            case Action::Pass:
            case Action::Fail:
            case Action::Skip:
                pkg.action = ev.action;
                pkg.elapsed = ev.elapsed;
                break;
            default:
                break;
        }
        return;
    }

    TestCase tc{ev.package, ev.test, ev.elapsed};
    switch(ev.action){
        case Action::Run:
            pkg.total++;
            break;
        case Action::Output:
            pkg.output[ev.test].push_back(ev.output);
            break;
        case Action::Pass:
            pkg.passed.push_back(tc);
            break;
        case Action::Fail:
            pkg.failed.push_back(tc);
            break;
        case Action::Skip:
            pkg.skipped.push_back(tc);
            break;
        default:
            break;
    }
}

void Execution::add_error(const std::string& line){
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(line);
}

std::map<std::string, Package> Execution::packages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return packages_;
}

bool Execution::has_package(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return packages_.count(name) != 0;
}

Package Execution::package(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = packages_.find(name);
    return it == packages_.end() ? Package{} : it->second;
}

std::vector<std::string> Execution::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

int Execution::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for(const auto& kv : packages_) n += kv.second.total;
    return n;
}

std::vector<TestCase> Execution::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TestCase> out;
    for(const auto& kv : packages_) out.insert(out.end(), kv.second.failed.begin(), kv.second.failed.end());
    return out;
}

std::vector<TestCase> Execution::skipped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TestCase> out;
    for(const auto& kv : packages_) out.insert(out.end(), kv.second.skipped.begin(), kv.second.skipped.end());
    return out;
}

std::vector<std::string> Execution::output(const std::string& pkg, const std::string& test) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = packages_.find(pkg);
    if(it == packages_.end()) return {};
    return it->second.output_of(test);
}

std::chrono::steady_clock::duration Execution::elapsed() const {
    return std::chrono::steady_clock::now() - started_;
}

}
