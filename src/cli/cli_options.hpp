#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shellpilot::cli {

struct CliOptions {
    std::string task;
    std::string model;
    std::optional<int> max_iterations;
    std::optional<int> command_timeout_s;
    std::optional<std::size_t> task_index;
    bool verbose = false;
    bool save = false;
    bool check = false;
    bool list_tasks = false;
    bool show_help = false;
    std::string error;

    bool Ok() const { return error.empty(); }
};

CliOptions ParseArgs(const std::vector<std::string>& args);
std::string Usage();

}  // namespace shellpilot::cli
