#pragma once
#include "Execution.h"
#include "Logging.h"
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace testsum {

enum class SummarySection { Failed, Skipped, Errors };

// Sections of the end-of-run summary to print. Starts from all() and only
// shrinks; removal is order-independent and idempotent.
class SummarySections {
public:
    static SummarySections all();
    static SummarySections none() { return SummarySections(); }

    // Drops every recognised name; unknown names are appended to unknown if given.
    SummarySections without(const std::vector<std::string>& names, std::vector<std::string>* unknown = nullptr) const;
    SummarySections without(SummarySection section) const;

    bool contains(SummarySection section) const { return sections_.count(section) != 0; }
    bool empty() const { return sections_.empty(); }
    std::size_t size() const { return sections_.size(); }

    bool operator==(const SummarySections& o) const { return sections_ == o.sections_; }
    bool operator!=(const SummarySections& o) const { return !(*this == o); }

private:
    std::set<SummarySection> sections_;
};

bool section_from_name(const std::string& name, SummarySection& out);
const char* section_name(SummarySection section);

// Effective sections for --no-summary; unknown names are logged and ignored.
SummarySections summary_sections(const std::vector<std::string>& no_summary, Logger& log);

// Writes the DONE line followed by the enabled detail sections.
// Throws ReportError when out fails.
void print_summary(std::ostream& out, const Execution& exec, const SummarySections& sections);

}
