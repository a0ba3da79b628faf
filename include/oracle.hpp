#ifndef ORACLE_HPP
#define ORACLE_HPP

#include "catalog.hpp"
#include "failures.hpp"
#include "toolchain.hpp"
#include "extractor.hpp"
#include "diagcol.hpp"
#include <string>

namespace pc {
    using std::string;

    // Answers which conversions in the synthesized source are rejected.
    class conversion_oracle {
        public:

        virtual ~conversion_oracle() { }
        virtual failure_set rejected_conversions(const string& source_path, const type_catalog& catalog) = 0;
    };

    // Builds the source with the Go toolchain and scrapes its errors.
    class compiler_oracle : public conversion_oracle {
        go_toolchain toolchain;
        diagnostic_collector& diags;
        const diagnostic_shape& shape;

        public:

        compiler_oracle(toolchain_options options, process_runner& runner, diagnostic_collector& diags, const diagnostic_shape& shape = diagnostic_shape::go_cannot_convert()) : toolchain(move(options), runner, diags), diags(diags), shape(shape) { }

        failure_set rejected_conversions(const string& source_path, const type_catalog& catalog) override {
            auto output = toolchain.harvest(source_path);
            return extract_failures(output, catalog, diags, shape);
        }
    };
}

#endif
