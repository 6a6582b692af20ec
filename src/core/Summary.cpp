#include "Summary.h"
#include "Errors.h"
#include "Formatters.h"
#include <cstdio>

namespace testsum {

SummarySections SummarySections::all(){
    SummarySections s;
    s.sections_ = {SummarySection::Failed, SummarySection::Skipped, SummarySection::Errors};
    return s;
}

SummarySections SummarySections::without(SummarySection section) const {
    SummarySections out = *this;
    out.sections_.erase(section);
    return out;
}

SummarySections SummarySections::without(const std::vector<std::string>& names, std::vector<std::string>* unknown) const {
    SummarySections out = *this;
    for(const auto& name : names){
        SummarySection section;
        if(section_from_name(name, section)) out.sections_.erase(section);
        else if(unknown) unknown->push_back(name);
    }
    return out;
}

bool section_from_name(const std::string& name, SummarySection& out){
    if(name == "failed"){ out = SummarySection::Failed; return true; }
    if(name == "skipped"){ out = SummarySection::Skipped; return true; }
    if(name == "errors"){ out = SummarySection::Errors; return true; }
    return false;
}

const char* section_name(SummarySection section){
    switch(section){
        case SummarySection::Failed: return "failed";
        case SummarySection::Skipped: return "skipped";
        case SummarySection::Errors: return "errors";
    }
    return "";
}

SummarySections summary_sections(const std::vector<std::string>& no_summary, Logger& log){
    std::vector<std::string> unknown;
    SummarySections sections = SummarySections::all().without(no_summary, &unknown);
    for(const auto& name : unknown) log.warn("ignoring unknown --no-summary section: " + name);
    return sections;
}

namespace {
    std::string plural(std::size_t n, const char* singular, const char* many){
        return std::to_string(n) + " " + (n == 1 ? singular : many);
    }

    void write_test_cases(std::ostream& out, const Execution& exec, const std::vector<TestCase>& cases, const char* verb){
        for(const auto& tc : cases){
            char elapsed[32];
            std::snprintf(elapsed, sizeof(elapsed), "(%.2fs)", tc.elapsed);
            out << "=== " << verb << ": " << tc.package << " " << tc.test << " " << elapsed << "\n";
            for(const auto& line : exec.output(tc.package, tc.test)){
                out << line;
                if(line.empty() || line.back() != '\n') out << '\n';
            }
            out << "\n";
        }
    }
}

void print_summary(std::ostream& out, const Execution& exec, const SummarySections& sections){
    auto failed = exec.failed();
    auto skipped = exec.skipped();
    auto errors = exec.errors();
    double elapsed = std::chrono::duration<double>(exec.elapsed()).count();

    out << "\nDONE " << plural(static_cast<std::size_t>(exec.total()), "test", "tests");
    if(!skipped.empty()) out << ", " << skipped.size() << " skipped";
    if(!failed.empty()) out << ", " << plural(failed.size(), "failure", "failures");
    if(!errors.empty()) out << ", " << plural(errors.size(), "error", "errors");
    out << " in " << format_elapsed(elapsed) << "\n";

    if(sections.contains(SummarySection::Skipped) && !skipped.empty()){
        out << "\n=== Skipped\n";
        write_test_cases(out, exec, skipped, "SKIP");
    }
    if(sections.contains(SummarySection::Failed) && !failed.empty()){
        out << "\n=== Failed\n";
        write_test_cases(out, exec, failed, "FAIL");
    }
    if(sections.contains(SummarySection::Errors) && !errors.empty()){
        out << "\n=== Errors\n";
        for(const auto& e : errors) out << e << "\n";
    }
    out.flush();
    if(!out) throw ReportError("failed to write summary");
}

}
