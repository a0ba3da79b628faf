#include "diags.hpp"
#include <ostream>

namespace pc::diags {
    using std::endl;

    const size_t MAX_OUTPUT_LINES = 10;

    void invalid_catalog::write(ostream& stream) const {
        stream << "Invalid type catalog: " << reason << endl;
    }

    void template_not_readable::write(ostream& stream) const {
        stream << "Could not read the template file '" << path << "': " << reason << endl;
    }

    void template_missing_placeholder::write(ostream& stream) const {
        stream << "The template file '" << path << "' does not contain the placeholder " << placeholder << endl;
    }

    void output_not_writable::write(ostream& stream) const {
        stream << "Could not write the generated source to '" << path << "': " << reason << endl;
    }

    void compiler_not_found::write(ostream& stream) const {
        stream << "The compiler '" << program << "' was not found: " << reason << endl;
    }

    void compiler_not_executed::write(ostream& stream) const {
        stream << "Could not run '" << command << "': " << reason << endl;
    }

    void compilation_succeeded::write(ostream& stream) const {
        stream << "The command '" << command << "' succeeded, but the generated code was expected to fail compilation" << endl;
        stream << "No conversion errors can be collected from a successful build" << endl;
    }

    void unexpected_exit_status::write(ostream& stream) const {
        stream << "The command '" << command << "' exited with status " << status << endl;
        if (status == expected)
            stream << "The output has no compiler errors, so the build failed for another reason" << endl;
        else
            stream << "Expected status " << expected << " (compilation errors reported)" << endl;

        if (!output.empty()) {
            stream << "Compiler output:" << endl;

            size_t index = 0, end_index, lines = 0;
            while (index < output.size() && lines < MAX_OUTPUT_LINES) {
                end_index = output.find('\n', index);
                if (end_index == string::npos)
                    end_index = output.size();
                stream << "  " << output.substr(index, end_index - index) << endl;
                index = end_index + 1;
                lines++;
            }

            if (index < output.size())
                stream << "  ..." << endl;
        }
    }

    void compiler_crashed::write(ostream& stream) const {
        stream << "The command '" << command << "' terminated abnormally: " << reason << endl;
    }

    void compiler_timed_out::write(ostream& stream) const {
        stream << "The command '" << command << "' did not finish within " << seconds << " seconds and was killed" << endl;
    }

    void compilation_cancelled::write(ostream& stream) const {
        stream << "Interrupted while running '" << command << "'" << endl;
    }

    void diagnostics_not_readable::write(ostream& stream) const {
        stream << "Could not read the compiler diagnostics: " << reason << endl;
    }

    void malformed_conversion_diagnostic::write(ostream& stream) const {
        stream << "Unrecognized conversion diagnostic:" << endl;
        stream << "  " << line << endl;
        stream << "The compiler's message format may have changed; results would be unreliable" << endl;
    }

    void unknown_type_in_diagnostic::write(ostream& stream) const {
        stream << "The type '" << name << "' is not in the catalog, in diagnostic:" << endl;
        stream << "  " << line << endl;
    }

    void no_conversion_failures::write(ostream& stream) const {
        stream << "The compiler rejected no conversions at all" << endl;
        stream << "Every pair will be reported as convertible; the compiler's message format has probably changed" << endl;
    }

    void report_not_written::write(ostream& stream) const {
        stream << "Could not write the report: " << reason << endl;
    }

    void stage_aborted::write(ostream& stream) const {
        stream << "Aborted while " << stage << endl;
    }

    void progress::write(ostream& stream) const {
        stream << message << endl;
    }
}
