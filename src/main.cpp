#include "catalog.hpp"
#include "diagcol.hpp"
#include "toolchain.hpp"
#include "oracle.hpp"
#include "pipeline.hpp"
#include "utils.hpp"
#include <fstream>
#include <vector>
#include <optional>
#include <iostream>
#include <unordered_map>
#include <algorithm>
#include <atomic>

#include <llvm/Support/Path.h>
#include <llvm/Support/Process.h>
#include <llvm/Support/Signals.h>

using std::string;
using std::cout;
using std::cerr;
using std::endl;
using std::ifstream;
using std::vector;
using std::optional;
using std::unordered_map;
using std::find;

static void print_help(const char* name) {
    cout << "Usage: " << name << " [options]" << endl;
    cout << "Builds a Go program converting every primitive type into every other one" << endl;
    cout << "and reports which conversions the compiler accepts." << endl;
    cout << "Options:" << endl;
    cout << "  -h, --help                     - Display this message" << endl;
    cout << "  -o <file>, --output <file>     - Write the generated Go source to <file>" << endl;
    cout << "                                   (default " << pc::DEFAULT_OUTPUT_PATH << ")" << endl;
    cout << "  -t <file>, --template <file>   - Use <file> as the Go source template" << endl;
    cout << "  -c <prog>, --compiler <prog>   - Use <prog> as the go command (default go)" << endl;
    cout << "  --timeout <seconds>            - Kill the compiler after <seconds>, 0 for no limit (default 120)" << endl;
    cout << "  --expected-status <code>       - Exit status meaning compilation errors were reported (default 1)" << endl;
    cout << "  --ascii                        - Print yes/no instead of glyphs" << endl;
    cout << "  -v, --verbose                  - Print progress notes" << endl;
    cout << "  --no-color                     - Disable colored diagnostics" << endl;
}

const unordered_map<string, size_t> OPTIONS = {
    { "-h", 0 }, { "--help", 0 },
    { "-o", 1 }, { "--output", 1 },
    { "-t", 1 }, { "--template", 1 },
    { "-c", 1 }, { "--compiler", 1 },
    { "--timeout", 1 },
    { "--expected-status", 1 },
    { "--ascii", 0 },
    { "-v", 0 }, { "--verbose", 0 },
    { "--no-color", 0 },
};

static std::atomic<bool> interrupted(false);

static void on_interrupt() {
    interrupted = true;
}

static bool validate_args(int argc, const char** argv);
static bool option_present(int argc, const char** argv, vector<string> options);
static optional<string> get_option_value(int argc, const char** argv, vector<string> options);
static bool get_number_option(int argc, const char** argv, vector<string> options, unsigned& value);

int main(int argc, const char** argv) {
    if (!validate_args(argc, argv))
        return 1;

    if (option_present(argc, argv, { "-h", "--help" })) {
        print_help(argv[0]);
        return 0;
    }

    pc::toolchain_options toolchain_options;
    pc::pipeline_options pipeline_options;

    unsigned expected_status = toolchain_options.expected_status;
    if (!get_number_option(argc, argv, { "--timeout" }, toolchain_options.timeout_seconds)
        || !get_number_option(argc, argv, { "--expected-status" }, expected_status))
        return 1;

    if (expected_status == 0 || expected_status > 255) {
        cerr << "The option '--expected-status' requires a non-zero exit status" << endl;
        return 1;
    }

    toolchain_options.expected_status = expected_status;

    if (auto program = get_option_value(argc, argv, { "-c", "--compiler" }))
        toolchain_options.program = *program;

    if (auto output = get_option_value(argc, argv, { "-o", "--output" }))
        pipeline_options.output_path = *output;

    pipeline_options.template_path = get_option_value(argc, argv, { "-t", "--template" });
    pipeline_options.app_name = llvm::sys::path::filename(argv[0]).str();
    pipeline_options.report.ascii = option_present(argc, argv, { "--ascii" });

    auto enable_colors = !option_present(argc, argv, { "--no-color" }) && llvm::sys::Process::StandardErrHasColors();

    llvm::sys::SetInterruptFunction(on_interrupt);

    pc::diagnostic_collector diags(option_present(argc, argv, { "-v", "--verbose" }));
    pc::llvm_process_runner runner(&interrupted);
    pc::compiler_oracle oracle(toolchain_options, runner, diags);

    auto catalog = pc::type_catalog::go_primitives();
    auto output_path = pipeline_options.output_path;

    pc::pipeline conversions(catalog, oracle, diags, pipeline_options);
    auto ok = conversions.run(cout);

    // the compiler reports the path without the leading "./"
    ifstream source(output_path);
    unordered_map<string, pc::ref<std::istream>> files;
    if (source.is_open()) {
        files.emplace(output_path, source);
        files.emplace(llvm::sys::path::remove_leading_dotslash(output_path).str(), source);
    }

    diags.report_all(cerr, enable_colors, files);

    return ok ? 0 : 1;
}

static bool validate_args(int argc, const char** argv) {
    auto iter = argv + 1;
    auto args_left = argc - 1;

    while (args_left > 0) {
        args_left--;

        if (OPTIONS.count(*iter) == 0) {
            cerr << "Unknown option '" << *iter << "'" << endl;
            return false;
        } else {
            args_left -= OPTIONS.at(*iter);
            if (args_left < 0) {
                cerr << "The option '" << *iter << "' requires a value" << endl;
                return false;
            }
            iter += OPTIONS.at(*iter);
        }

        iter++;
    }

    return true;
}

static bool option_present(int argc, const char** argv, vector<string> options) {
    auto begin = argv + 1;
    auto end = argv + argc;

    for (auto& option : options) {
        if (find(begin, end, option) != end)
            return true;
    }
    return false;
}

static optional<string> get_option_value(int argc, const char** argv, vector<string> options) {
    auto begin = argv + 1;
    auto end = argv + argc;

    for (auto& option : options) {
        const char** iter = find(begin, end, option);
        if (iter != end && iter + 1 != end)
            return { *(iter + 1) };
    }
    return { };
}

static bool get_number_option(int argc, const char** argv, vector<string> options, unsigned& value) {
    auto text = get_option_value(argc, argv, options);
    if (!text)
        return true;

    auto number = pc::utils::parse_unsigned(*text);
    if (!number) {
        cerr << "The option '" << options.front() << "' requires a non-negative number, got '" << *text << "'" << endl;
        return false;
    }

    value = *number;
    return true;
}
