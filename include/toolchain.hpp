#ifndef TOOLCHAIN_HPP
#define TOOLCHAIN_HPP

#include "diagcol.hpp"
#include <string>
#include <vector>
#include <atomic>

namespace pc {
    using std::string;
    using std::vector;

    struct command {
        string program;
        vector<string> args;

        string str() const;
    };

    struct process_result {
        enum outcome_t {
            EXITED,
            NOT_FOUND,
            NOT_EXECUTED,
            CRASHED,
            TIMED_OUT,
            CANCELLED,
            NOT_CAPTURED,
        } outcome;

        int status = 0;
        string diagnostics;
        string message;
    };

    // Runs one child process to completion and collects its standard error.
    // The program is looked up on PATH unless it contains a slash. A zero
    // timeout waits forever.
    class process_runner {
        public:

        virtual ~process_runner() { }
        virtual process_result run(const command& cmd, unsigned timeout_seconds) = 0;
    };

    class llvm_process_runner : public process_runner {
        const std::atomic<bool>* cancelled;

        public:

        llvm_process_runner(const std::atomic<bool>* cancelled = nullptr) : cancelled(cancelled) { }
        process_result run(const command& cmd, unsigned timeout_seconds) override;
    };

    struct toolchain_options {
        string program = "go";
        unsigned timeout_seconds = 120;
        int expected_status = 1;
    };

    // Runs the Go build over the synthesized source. The only accepted
    // outcome is exit status expected_status with compiler errors on stderr,
    // since "go build" uses the same status for module and setup failures.
    class go_toolchain {
        toolchain_options options;
        process_runner& runner;
        diagnostic_collector& diags;

        public:

        go_toolchain(toolchain_options options, process_runner& runner, diagnostic_collector& diags) : options(move(options)), runner(runner), diags(diags) { }

        command build_command(const string& source_path) const;
        string harvest(const string& source_path) const;

        // True if the output has a package header ("# <package>") or a
        // "file:line:column: " diagnostic.
        static bool reports_compile_errors(const string& diagnostics);

        private:

        template<typename T>
        [[noreturn]] void error(T&& diag) const {
            diags.add(make_unique<T>(move(diag)));
            throw pipeline_error();
        }
    };
}

#endif
