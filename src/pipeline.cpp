#include "pipeline.hpp"
#include "generator.hpp"
#include "diags.hpp"
#include "utils.hpp"

namespace pc {
    using namespace pc::utils;
    using std::to_string;
    using std::chrono::steady_clock;

    const string DEFAULT_OUTPUT_PATH = "./output/conversions.go";

    bool pipeline::run(ostream& output) {
        auto start = steady_clock::now();
        failures.reset();

        if (!stage("generating", [&] () { generate(); }))
            return false;

        if (!stage("compiling", [&] () { compile(); }))
            return false;

        if (failures->empty())
            diags.add(make_ptr(diags::no_conversion_failures()));

        return stage("reporting", [&] () { report(output, start); });
    }

    bool pipeline::stage(const string& name, function<void()> func) {
        try {
            func();
        } catch (pipeline_error) {
            diags.add(make_ptr(diags::stage_aborted(name)));
            return false;
        }

        return true;
    }

    void pipeline::generate() {
        source_generator generator(catalog, diags, options.app_name);

        auto code_template = generator.load_template(options.template_path);
        auto source = generator.generate(code_template, options.template_path.value_or("<built-in template>"));
        generator.write(source, options.output_path);

        diags.add(make_ptr(diags::progress("Generated " + to_string(catalog.pair_count()) + " conversions into '" + options.output_path + "'")));
    }

    void pipeline::compile() {
        failures = oracle.rejected_conversions(options.output_path, catalog);
    }

    void pipeline::report(ostream& output, steady_clock::time_point start) {
        report_writer writer(catalog, options.report);

        writer.write_matrix(output, *failures);
        writer.write_summary(output, *failures);
        writer.write_duration(output, steady_clock::now() - start);
        output.flush();

        if (!output) {
            diags.add(make_ptr(diags::report_not_written("the output stream reported an error")));
            throw pipeline_error();
        }
    }
}
