#include "extractor.hpp"
#include "generator.hpp"
#include "diags.hpp"
#include "utils.hpp"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Regex.h>

namespace pc {
    using namespace pc::utils;
    using std::to_string;

    enum shape_group {
        WHOLE = 0,
        PREFIX,
        FILE_NAME,
        LINE,
        COLUMN,
        FROM_TYPE,
        STATIC_TYPE,
        TO_TYPE,
    };

    const diagnostic_shape& diagnostic_shape::go_cannot_convert() {
        static const diagnostic_shape shape = {
            "go-cannot-convert",
            "cannot convert",
            "^((.+):([0-9]+):([0-9]+): )?"
            "cannot convert " + VALUE_HOLDER + "\\.([A-Za-z_][A-Za-z0-9_]*) "
            "\\((.+)\\) "
            "to type ([A-Za-z_][A-Za-z0-9_]*)$",
        };
        return shape;
    }

    static optional<conversion_failure> match_line(const llvm::Regex& regex, const string& line) {
        llvm::SmallVector<llvm::StringRef, 8> groups;
        if (!regex.match(line, &groups) || groups.size() <= TO_TYPE)
            return { };

        conversion_failure failure { { groups[FROM_TYPE].str(), groups[TO_TYPE].str() }, { } };

        if (!groups[PREFIX].empty()) {
            auto line_number = parse_unsigned(groups[LINE]);
            auto column = parse_unsigned(groups[COLUMN]);
            if (line_number && column)
                failure.loc = whole_line(groups[FILE_NAME].str(), *line_number, *column);
        }

        return failure;
    }

    bool is_conversion_line(const string& line, const diagnostic_shape& shape) {
        return line.find(shape.marker) != string::npos;
    }

    optional<conversion_failure> parse_conversion_line(const string& line, const diagnostic_shape& shape) {
        llvm::Regex regex(shape.pattern);
        return match_line(regex, line);
    }

    failure_set extract_failures(const string& diagnostics, const type_catalog& catalog, diagnostic_collector& diags, const diagnostic_shape& shape) {
        llvm::Regex regex(shape.pattern);
        failure_set failures;
        size_t conversion_lines = 0;

        for (auto& line : split_lines(diagnostics)) {
            if (!is_conversion_line(line, shape))
                continue;

            conversion_lines++;

            auto failure = match_line(regex, line);
            if (!failure) {
                diags.add(make_ptr(diags::malformed_conversion_diagnostic(line)));
                throw pipeline_error();
            }

            for (auto name : { &failure->pair.from, &failure->pair.to }) {
                if (!catalog.contains(*name)) {
                    diags::unknown_type_in_diagnostic diag(line, *name);
                    diag.loc = failure->loc;
                    diags.add(make_ptr(move(diag)));
                    throw pipeline_error();
                }
            }

            failures.add(move(*failure));
        }

        diags.add(make_ptr(diags::progress("Collected " + to_string(failures.size()) + " conversion errors from " + to_string(conversion_lines) + " '" + shape.marker + "' lines")));
        return failures;
    }
}
