#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace shellpilot::exec {

enum class ExecStatus {
    kExited,
    kTimeout,
    kSpawnError
};

enum class StreamKind {
    kStdout,
    kStderr
};

struct CommandResult {
    ExecStatus status = ExecStatus::kExited;
    int exit_code = -1;
    std::string output;
    std::string error;

    bool Succeeded() const { return status == ExecStatus::kExited && exit_code == 0; }
    // "0", "1", ..., "TIMEOUT" or "SPAWN_ERROR".
    std::string ExitLabel() const;
};

struct ExecOptions {
    std::string shell = "/bin/sh";
    std::string working_dir;
    std::chrono::seconds timeout{120};
    std::size_t stdout_tail = 2000;
    std::size_t stderr_tail = 800;
};

using LineHandler = std::function<void(StreamKind, const std::string&)>;

// Runs one command through `<shell> -c`. Both pipes are drained on separate
// threads while the command runs; each line is handed to the LineHandler as
// soon as it is read. The handler is never called concurrently. The timeout
// covers both the shell and any background process it leaves holding the
// pipes; either is killed with its process group once the deadline passes.
class CommandExecutor {
public:
    explicit CommandExecutor(ExecOptions options = {});

    CommandResult Run(const std::string& command, const LineHandler& on_line = {}) const;

    const ExecOptions& Options() const { return options_; }

private:
    ExecOptions options_;
};

}  // namespace shellpilot::exec
