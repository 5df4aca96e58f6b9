#include "agent/task_store.hpp"

#include <algorithm>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace shellpilot::agent {

TaskStore::TaskStore(std::filesystem::path path)
    : path_(std::move(path)) {}

std::filesystem::path TaskStore::DefaultPath() {
    return shellpilot::utils::GetDataDir() / "saved_tasks.json";
}

std::vector<std::string> TaskStore::List() const {
    std::vector<std::string> tasks;
    std::ifstream input(path_);
    if (!input.is_open()) {
        return tasks;
    }
    auto json = nlohmann::json::parse(input, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        shellpilot::utils::Log(shellpilot::utils::LogLevel::kWarn, "tasks",
                               "ignoring malformed " + path_.string());
        return tasks;
    }
    for (const auto& item : json) {
        if (item.is_string()) {
            tasks.push_back(item.get<std::string>());
        }
    }
    return tasks;
}

bool TaskStore::Add(const std::string& task) {
    const auto trimmed = shellpilot::utils::Trim(task);
    if (trimmed.empty()) {
        return false;
    }
    auto tasks = List();
    if (std::find(tasks.begin(), tasks.end(), trimmed) != tasks.end()) {
        return false;
    }
    tasks.push_back(trimmed);
    return Write(tasks);
}

bool TaskStore::Remove(std::size_t index) {
    auto tasks = List();
    if (index >= tasks.size()) {
        return false;
    }
    tasks.erase(tasks.begin() + static_cast<std::ptrdiff_t>(index));
    return Write(tasks);
}

bool TaskStore::Write(const std::vector<std::string>& tasks) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    std::ofstream output(path_, std::ios::trunc);
    if (!output.is_open()) {
        shellpilot::utils::Log(shellpilot::utils::LogLevel::kError, "tasks",
                               "cannot write " + path_.string());
        return false;
    }
    output << nlohmann::json(tasks).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    return static_cast<bool>(output);
}

}  // namespace shellpilot::agent
