#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "catalog.hpp"
#include "failures.hpp"
#include "oracle.hpp"
#include "report.hpp"
#include "diagcol.hpp"
#include <string>
#include <optional>
#include <ostream>
#include <functional>
#include <chrono>

namespace pc {
    using std::string;
    using std::optional;
    using std::ostream;
    using std::function;

    extern const string DEFAULT_OUTPUT_PATH;

    struct pipeline_options {
        optional<string> template_path;
        string output_path = DEFAULT_OUTPUT_PATH;
        string app_name = "primconv";
        report_options report;
    };

    // generate -> compile -> report. Any error aborts the whole run.
    class pipeline {
        const type_catalog& catalog;
        conversion_oracle& oracle;
        diagnostic_collector& diags;
        pipeline_options options;
        optional<failure_set> failures;

        public:

        pipeline(const type_catalog& catalog, conversion_oracle& oracle, diagnostic_collector& diags, pipeline_options options) : catalog(catalog), oracle(oracle), diags(diags), options(move(options)) { }

        bool run(ostream& output);

        const optional<failure_set>& rejected() const { return failures; }

        private:

        bool stage(const string& name, function<void()> func);
        void generate();
        void compile();
        void report(ostream& output, std::chrono::steady_clock::time_point start);
    };
}

#endif
