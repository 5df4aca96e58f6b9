#include "exec/command_executor.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace shellpilot::exec {
namespace bp = boost::process;

namespace {

using shellpilot::utils::Log;
using shellpilot::utils::LogLevel;

// Puts the shell in its own process group so a timeout can take down
// everything it started.
struct NewProcessGroup : bp::extend::handler {
    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
    }
};

bool WaitUntil(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

}  // namespace

std::string CommandResult::ExitLabel() const {
    switch (status) {
        case ExecStatus::kTimeout: return "TIMEOUT";
        case ExecStatus::kSpawnError: return "SPAWN_ERROR";
        case ExecStatus::kExited: break;
    }
    return std::to_string(exit_code);
}

CommandExecutor::CommandExecutor(ExecOptions options)
    : options_(std::move(options)) {
    if (options_.working_dir.empty()) {
        std::error_code ec;
        options_.working_dir = std::filesystem::current_path(ec).string();
    }
}

CommandResult CommandExecutor::Run(const std::string& command, const LineHandler& on_line) const {
    CommandResult result{};
    bp::ipstream out_stream;
    bp::ipstream err_stream;

    std::unique_ptr<bp::child> child;
    try {
        child = std::make_unique<bp::child>(
            bp::exe = options_.shell,
            bp::args = std::vector<std::string>{"-c", command},
            bp::start_dir = options_.working_dir,
            bp::std_in < bp::null,
            bp::std_out > out_stream,
            bp::std_err > err_stream,
            NewProcessGroup{});
    } catch (const bp::process_error& ex) {
        Log(LogLevel::kWarn, "exec", std::string("spawn failed: ") + ex.what());
        result.status = ExecStatus::kSpawnError;
        result.exit_code = -1;
        result.error = ex.what();
        return result;
    }

    std::mutex line_mutex;
    std::condition_variable drained;
    int open_streams = 2;
    std::vector<std::string> out_lines;
    std::vector<std::string> err_lines;
    auto reader = [&](bp::ipstream& stream, std::vector<std::string>& lines, StreamKind kind) {
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
            if (on_line) {
                std::lock_guard<std::mutex> guard(line_mutex);
                on_line(kind, line);
            }
        }
        std::lock_guard<std::mutex> guard(line_mutex);
        --open_streams;
        drained.notify_all();
    };
    std::thread out_reader(reader, std::ref(out_stream), std::ref(out_lines), StreamKind::kStdout);
    std::thread err_reader(reader, std::ref(err_stream), std::ref(err_lines), StreamKind::kStderr);

    const pid_t pid = child->id();
    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    int status = 0;
    bool finished = WaitUntil(pid, status, deadline);
    bool stragglers_killed = false;
    if (!finished) {
        result.status = ExecStatus::kTimeout;
        Log(LogLevel::kInfo, "exec", "timeout, terminating pid=" + std::to_string(pid));
        ::kill(-pid, SIGTERM);
        finished = WaitUntil(pid, status, std::chrono::steady_clock::now() + std::chrono::seconds(2));
        if (!finished) {
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
        // Stragglers that kept the pipes open die with the group.
        ::kill(-pid, SIGKILL);
    } else {
        // The shell is gone, but background children may still hold the pipes.
        std::unique_lock<std::mutex> lock(line_mutex);
        if (!drained.wait_until(lock, deadline, [&]() { return open_streams == 0; })) {
            lock.unlock();
            Log(LogLevel::kInfo, "exec", "background processes still hold output, killing group " +
                std::to_string(pid));
            ::kill(-pid, SIGKILL);
            stragglers_killed = true;
        }
    }

    out_reader.join();
    err_reader.join();

    if (stragglers_killed) {
        err_lines.push_back("Background processes still writing after " +
                            std::to_string(options_.timeout.count()) + " s were stopped.");
    }
    if (result.status == ExecStatus::kTimeout) {
        result.exit_code = 124;
        err_lines.push_back("Timed out after " + std::to_string(options_.timeout.count()) + " s.");
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    result.output = shellpilot::utils::Tail(shellpilot::utils::Join(out_lines, "\n"), options_.stdout_tail);
    result.error = shellpilot::utils::Tail(shellpilot::utils::Join(err_lines, "\n"), options_.stderr_tail);
    Log(LogLevel::kDebug, "exec", "exit=" + result.ExitLabel() + " stdout=" +
        std::to_string(result.output.size()) + " stderr=" + std::to_string(result.error.size()));
    return result;
}

}  // namespace shellpilot::exec
