#include "report.hpp"
#include <sstream>
#include <iomanip>

namespace pc {
    using std::ostringstream;
    using std::endl;
    using std::setw;
    using std::left;
    using std::right;
    using std::fixed;
    using std::setprecision;

    const size_t NAME_WIDTH = 10;

    const string CONVERTIBLE_GLYPH = "✅";
    const string NOT_CONVERTIBLE_GLYPH = "❌";

    string report_writer::section_header(const string& from) const {
        return "---------- converting " + from + " values ----------";
    }

    string report_writer::verdict_line(const conversion_pair& pair, bool convertible) const {
        ostringstream stream;
        stream << right << setw(NAME_WIDTH) << pair.from << " -> " << left << setw(NAME_WIDTH) << pair.to << " ";

        if (options.ascii)
            stream << (convertible ? "yes" : "no");
        else
            stream << (convertible ? CONVERTIBLE_GLYPH : NOT_CONVERTIBLE_GLYPH);

        return stream.str();
    }

    void report_writer::write_matrix(ostream& stream, const failure_set& failures) const {
        for (auto& from : catalog.types()) {
            stream << section_header(from) << endl;

            for (auto& to : catalog.types()) {
                conversion_pair pair { from, to };
                stream << verdict_line(pair, is_convertible(failures, pair)) << endl;
            }
        }
    }

    void report_writer::write_summary(ostream& stream, const failure_set& failures) const {
        size_t convertible = 0;
        catalog.for_each_pair([&] (const conversion_pair& pair) {
            if (is_convertible(failures, pair))
                convertible++;
        });

        stream << convertible << " of " << catalog.pair_count() << " conversions are valid" << endl;
    }

    void report_writer::write_duration(ostream& stream, std::chrono::nanoseconds duration) const {
        stream << "execution took " << format_duration(duration) << endl;
    }

    string format_duration(std::chrono::nanoseconds duration) {
        using std::chrono::duration_cast;
        using std::chrono::microseconds;

        auto micros = duration_cast<microseconds>(duration).count();

        ostringstream stream;
        stream << fixed << setprecision(3);

        if (micros < 1000)
            stream << micros << "us";
        else if (micros < 1000000)
            stream << micros / 1000.0 << "ms";
        else
            stream << micros / 1000000.0 << "s";

        return stream.str();
    }
}
