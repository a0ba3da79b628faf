#include "generator.hpp"
#include "diags.hpp"
#include "utils.hpp"

#include <sstream>
#include <algorithm>

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

namespace pc {
    using namespace pc::utils;
    using std::ostringstream;
    using std::max;

    const string VALUE_HOLDER = "p";

    const string APP_PLACEHOLDER = "{{app}}";
    const string FIELDS_PLACEHOLDER = "{{fields}}";
    const string CONVERSIONS_PLACEHOLDER = "{{conversions}}";

    const string DEFAULT_TEMPLATE = R"CODE(// Code generated by {{app}}. DO NOT EDIT.

// Every statement below converts a zero value of one primitive type into
// another. The build is expected to fail; each rejected conversion is
// reported as a "cannot convert" error.

package main

var p struct {
{{fields}}
}

func main() {
{{conversions}}
}
)CODE";

    string source_generator::load_template(const optional<string>& path) const {
        if (!path)
            return DEFAULT_TEMPLATE;

        auto buffer = llvm::MemoryBuffer::getFile(*path, true);
        if (!buffer)
            error(diags::template_not_readable(*path, buffer.getError().message()));

        return (*buffer)->getBuffer().str();
    }

    string source_generator::generate(const string& code_template, const string& template_name) const {
        for (auto& placeholder : { FIELDS_PLACEHOLDER, CONVERSIONS_PLACEHOLDER }) {
            if (code_template.find(placeholder) == string::npos)
                error(diags::template_missing_placeholder(template_name, placeholder));
        }

        auto source = code_template;
        replace_all(source, APP_PLACEHOLDER, app_name);
        replace_all(source, FIELDS_PLACEHOLDER, field_declarations());
        replace_all(source, CONVERSIONS_PLACEHOLDER, conversion_statements());
        return source;
    }

    string source_generator::field_declarations() const {
        size_t width = 0;
        for (auto& type : catalog.types())
            width = max(width, type.length());

        ostringstream stream;
        auto first = true;

        for (auto& type : catalog.types()) {
            if (!first)
                stream << "\n";
            first = false;

            stream << "\t" << type << string(width - type.length() + 1, ' ') << type;
        }

        return stream.str();
    }

    string source_generator::conversion_statements() const {
        ostringstream stream;
        auto first = true;

        for (auto& from : catalog.types()) {
            if (!first)
                stream << "\n\n";
            first = false;

            stream << "\t// " << from;
            for (auto& to : catalog.types())
                stream << "\n\t_ = " << to << "(" << VALUE_HOLDER << "." << from << ")";
        }

        return stream.str();
    }

    void source_generator::write(const string& source, const string& output_path) const {
        auto directory = llvm::sys::path::parent_path(output_path);
        if (!directory.empty()) {
            if (auto ec = llvm::sys::fs::create_directories(directory))
                error(diags::output_not_writable(output_path, ec.message()));
        }

        std::error_code ec;
        llvm::raw_fd_ostream output(output_path, ec, llvm::sys::fs::OF_Text);
        if (ec)
            error(diags::output_not_writable(output_path, ec.message()));

        output << source;
        output.close();

        if (output.has_error()) {
            auto reason = output.error().message();
            output.clear_error();
            error(diags::output_not_writable(output_path, reason));
        }
    }
}
