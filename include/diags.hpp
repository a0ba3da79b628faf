#ifndef DIAGS_HPP
#define DIAGS_HPP

#include "diagcol.hpp"
#include <ostream>
#include <string>

namespace pc::diags {
    using std::ostream;
    using std::string;

    struct error : diagnostic {
        error() : diagnostic(ERROR) { }
    };

    struct warning : diagnostic {
        warning() : diagnostic(WARNING) { }
    };

    struct note : diagnostic {
        note() : diagnostic(NOTE) { }
    };

    #define DIAG0(name, base) \
        struct name : base { \
            void write(ostream& stream) const override; \
        }

    #define DIAG1(name, base, type1, name1) \
        struct name : base { \
            type1 name1; \
            name(type1 name1) : name1(move(name1)) { } \
            void write(ostream& stream) const override; \
        }

    #define DIAG2(name, base, type1, name1, type2, name2) \
        struct name : base { \
            type1 name1; \
            type2 name2; \
            name(type1 name1, type2 name2) : name1(move(name1)), name2(move(name2)) { } \
            void write(ostream& stream) const override; \
        }

    #define DIAG4(name, base, type1, name1, type2, name2, type3, name3, type4, name4) \
        struct name : base { \
            type1 name1; \
            type2 name2; \
            type3 name3; \
            type4 name4; \
            name(type1 name1, type2 name2, type3 name3, type4 name4) : name1(move(name1)), name2(move(name2)), name3(move(name3)), name4(move(name4)) { } \
            void write(ostream& stream) const override; \
        }

    // Configuration

    DIAG1(invalid_catalog, error, string, reason);

    // Source synthesis

    DIAG2(template_not_readable, error, string, path, string, reason);
    DIAG2(template_missing_placeholder, error, string, path, string, placeholder);
    DIAG2(output_not_writable, error, string, path, string, reason);

    // Compiler invocation

    DIAG2(compiler_not_found, error, string, program, string, reason);
    DIAG2(compiler_not_executed, error, string, command, string, reason);
    DIAG1(compilation_succeeded, error, string, command);
    DIAG4(unexpected_exit_status, error, string, command, int, status, int, expected, string, output);
    DIAG2(compiler_crashed, error, string, command, string, reason);
    DIAG2(compiler_timed_out, error, string, command, unsigned, seconds);
    DIAG1(compilation_cancelled, error, string, command);
    DIAG1(diagnostics_not_readable, error, string, reason);

    // Diagnostic extraction

    DIAG1(malformed_conversion_diagnostic, error, string, line);
    DIAG2(unknown_type_in_diagnostic, error, string, line, string, name);
    DIAG0(no_conversion_failures, warning);

    // Reporting

    DIAG1(report_not_written, error, string, reason);

    // Pipeline

    DIAG1(stage_aborted, error, string, stage);
    DIAG1(progress, note, string, message);
}

#endif
