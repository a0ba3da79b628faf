#ifndef EXTRACTOR_HPP
#define EXTRACTOR_HPP

#include "catalog.hpp"
#include "failures.hpp"
#include "diagcol.hpp"
#include <string>
#include <optional>

namespace pc {
    using std::string;
    using std::optional;

    // How a rejected conversion shows up in compiler output. Pinned to the
    // wording of the Go compiler, both the gc front end ("(type T)") and
    // types2 ("(variable of type T)"):
    //
    //   [file:line:column: ]cannot convert p.<from> (<static type>) to type <to>
    struct diagnostic_shape {
        string name;
        string marker;
        string pattern;

        static const diagnostic_shape& go_cannot_convert();
    };

    bool is_conversion_line(const string& line, const diagnostic_shape& shape = diagnostic_shape::go_cannot_convert());

    // Parses one diagnostic line. Returns nothing if the line does not have
    // the expected shape.
    optional<conversion_failure> parse_conversion_line(const string& line, const diagnostic_shape& shape = diagnostic_shape::go_cannot_convert());

    // Collects every conversion error in the compiler output. A line carrying
    // the marker that cannot be parsed, or that names a type outside the
    // catalog, aborts extraction.
    failure_set extract_failures(const string& diagnostics, const type_catalog& catalog, diagnostic_collector& diags, const diagnostic_shape& shape = diagnostic_shape::go_cannot_convert());
}

#endif
