#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace shellpilot::agent {

// Reusable task texts kept in a JSON array on disk.
class TaskStore {
public:
    explicit TaskStore(std::filesystem::path path);

    static std::filesystem::path DefaultPath();

    std::vector<std::string> List() const;
    // False when the task was already saved or the file could not be written.
    bool Add(const std::string& task);
    bool Remove(std::size_t index);

    const std::filesystem::path& Path() const { return path_; }

private:
    bool Write(const std::vector<std::string>& tasks) const;

    std::filesystem::path path_;
};

}  // namespace shellpilot::agent
