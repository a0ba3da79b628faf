#ifndef REPORT_HPP
#define REPORT_HPP

#include "catalog.hpp"
#include "failures.hpp"
#include <ostream>
#include <string>
#include <chrono>

namespace pc {
    using std::ostream;
    using std::string;

    struct report_options {
        bool ascii = false;
    };

    class report_writer {
        const type_catalog& catalog;
        report_options options;

        public:

        report_writer(const type_catalog& catalog, report_options options) : catalog(catalog), options(options) { }

        void write_matrix(ostream& stream, const failure_set& failures) const;
        void write_summary(ostream& stream, const failure_set& failures) const;
        void write_duration(ostream& stream, std::chrono::nanoseconds duration) const;

        string section_header(const string& from) const;
        string verdict_line(const conversion_pair& pair, bool convertible) const;
    };

    string format_duration(std::chrono::nanoseconds duration);
}

#endif
