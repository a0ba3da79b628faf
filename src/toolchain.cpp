#include "toolchain.hpp"
#include "diags.hpp"
#include "utils.hpp"

#include <chrono>
#include <thread>
#include <signal.h>

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/Optional.h>
#include <llvm/Support/Program.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/Regex.h>

namespace pc {
    using namespace pc::utils;
    using std::to_string;
    using std::chrono::steady_clock;
    using std::chrono::seconds;
    using std::chrono::milliseconds;

    const auto POLL_INTERVAL = milliseconds(20);

    string command::str() const {
        auto result = program;
        for (auto& arg : args)
            result += " " + arg;
        return result;
    }

    static void kill_and_reap(const llvm::sys::ProcessInfo& info) {
        ::kill(info.Pid, SIGKILL);
        llvm::sys::Wait(info, 0, true);
    }

    process_result llvm_process_runner::run(const command& cmd, unsigned timeout_seconds) {
        auto program_path = llvm::sys::findProgramByName(cmd.program);
        if (!program_path)
            return { process_result::NOT_FOUND, -1, "", program_path.getError().message() };

        // stderr goes to a temporary file that is always removed
        llvm::SmallString<128> stderr_path;
        if (auto ec = llvm::sys::fs::createTemporaryFile("primconv", "stderr", stderr_path))
            return { process_result::NOT_CAPTURED, -1, "", "could not create a temporary file: " + ec.message() };

        llvm::FileRemover remover(stderr_path);
        llvm::sys::RemoveFileOnSignal(stderr_path);

        vector<llvm::StringRef> argv;
        argv.push_back(cmd.program);
        for (auto& arg : cmd.args)
            argv.push_back(arg);

        llvm::Optional<llvm::StringRef> redirects[] = {
            llvm::StringRef(""),
            llvm::StringRef(""),
            stderr_path.str(),
        };

        string message;
        bool failed = false;
        auto info = llvm::sys::ExecuteNoWait(*program_path, argv, llvm::None, redirects, 0, &message, &failed);

        if (failed || info.Pid == llvm::sys::ProcessInfo::InvalidPid) {
            llvm::sys::DontRemoveFileOnSignal(stderr_path);
            return { process_result::NOT_EXECUTED, -1, "", message };
        }

        auto deadline = steady_clock::now() + seconds(timeout_seconds);
        llvm::sys::ProcessInfo waited;

        while (true) {
            waited = llvm::sys::Wait(info, 0, false, &message);
            if (waited.Pid != 0)
                break;

            if (cancelled && cancelled->load()) {
                kill_and_reap(info);
                llvm::sys::DontRemoveFileOnSignal(stderr_path);
                return { process_result::CANCELLED, -1, "", "" };
            }

            if (timeout_seconds != 0 && steady_clock::now() >= deadline) {
                kill_and_reap(info);
                llvm::sys::DontRemoveFileOnSignal(stderr_path);
                return { process_result::TIMED_OUT, -1, "", "" };
            }

            std::this_thread::sleep_for(POLL_INTERVAL);
        }

        // an interrupt may have removed the stderr file already
        if (cancelled && cancelled->load()) {
            llvm::sys::DontRemoveFileOnSignal(stderr_path);
            return { process_result::CANCELLED, -1, "", "" };
        }

        process_result result { process_result::EXITED, waited.ReturnCode, "", message };

        if (waited.ReturnCode == -1)
            result.outcome = process_result::NOT_EXECUTED;
        else if (waited.ReturnCode == -2)
            result.outcome = process_result::CRASHED;

        auto buffer = llvm::MemoryBuffer::getFile(stderr_path, true);
        if (buffer)
            result.diagnostics = (*buffer)->getBuffer().str();
        else if (result.outcome == process_result::EXITED) {
            result.outcome = process_result::NOT_CAPTURED;
            result.message = buffer.getError().message();
        }

        llvm::sys::DontRemoveFileOnSignal(stderr_path);
        return result;
    }

    command go_toolchain::build_command(const string& source_path) const {
        return { options.program, { "build", "-gcflags=-e", "-o", "/dev/null", source_path } };
    }

    string go_toolchain::harvest(const string& source_path) const {
        auto cmd = build_command(source_path);
        auto result = runner.run(cmd, options.timeout_seconds);

        switch (result.outcome) {
            case process_result::EXITED:
                break;

            case process_result::NOT_FOUND:
                error(diags::compiler_not_found(cmd.program, result.message));

            case process_result::NOT_EXECUTED:
                error(diags::compiler_not_executed(cmd.str(), result.message));

            case process_result::CRASHED:
                error(diags::compiler_crashed(cmd.str(), result.message));

            case process_result::TIMED_OUT:
                error(diags::compiler_timed_out(cmd.str(), options.timeout_seconds));

            case process_result::CANCELLED:
                error(diags::compilation_cancelled(cmd.str()));

            case process_result::NOT_CAPTURED:
                error(diags::diagnostics_not_readable(result.message));
        }

        if (result.status == 0)
            error(diags::compilation_succeeded(cmd.str()));

        if (result.status != options.expected_status || !reports_compile_errors(result.diagnostics))
            error(diags::unexpected_exit_status(cmd.str(), result.status, options.expected_status, result.diagnostics));

        diags.add(make_ptr(diags::progress("'" + cmd.str() + "' exited with status " + to_string(result.status) + " as expected")));
        return result.diagnostics;
    }

    bool go_toolchain::reports_compile_errors(const string& diagnostics) {
        static const llvm::Regex compile_error("^[^[:space:]].*:[0-9]+:[0-9]+: ");

        for (auto& line : split_lines(diagnostics)) {
            if (line.compare(0, 2, "# ") == 0 || compile_error.match(line))
                return true;
        }
        return false;
    }
}
