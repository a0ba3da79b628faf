#ifndef GENERATOR_HPP
#define GENERATOR_HPP

#include "catalog.hpp"
#include "diagcol.hpp"
#include <string>
#include <optional>

namespace pc {
    using std::string;
    using std::optional;

    // Name of the struct variable whose fields hold one zero value per type.
    // The diagnostic shape depends on it.
    extern const string VALUE_HOLDER;

    extern const string APP_PLACEHOLDER;
    extern const string FIELDS_PLACEHOLDER;
    extern const string CONVERSIONS_PLACEHOLDER;

    extern const string DEFAULT_TEMPLATE;

    class source_generator {
        const type_catalog& catalog;
        diagnostic_collector& diags;
        string app_name;

        public:

        source_generator(const type_catalog& catalog, diagnostic_collector& diags, string app_name) : catalog(catalog), diags(diags), app_name(move(app_name)) { }

        // Reads the template at path, or returns the built-in one.
        string load_template(const optional<string>& path) const;

        string generate(const string& code_template, const string& template_name) const;
        void write(const string& source, const string& output_path) const;

        string field_declarations() const;
        string conversion_statements() const;

        private:

        template<typename T>
        [[noreturn]] void error(T&& diag) const {
            diags.add(make_unique<T>(move(diag)));
            throw pipeline_error();
        }
    };
}

#endif
