#include "agent/conversation.hpp"

#include <utility>

namespace shellpilot::agent {

Conversation::Conversation(std::string system_prompt) {
    messages_.push_back({"system", std::move(system_prompt)});
}

void Conversation::Append(const std::string& role, const std::string& content) {
    messages_.push_back({role, content});
}

std::vector<shellpilot::providers::Message> Conversation::Window(std::size_t max_recent) const {
    if (messages_.size() - 1 <= max_recent) {
        return messages_;
    }
    std::vector<shellpilot::providers::Message> window;
    window.reserve(max_recent + 1);
    window.push_back(messages_.front());
    window.insert(window.end(), messages_.end() - static_cast<std::ptrdiff_t>(max_recent), messages_.end());
    return window;
}

void Conversation::HardReset(const std::string& reanchor) {
    auto system_message = std::move(messages_.front());
    messages_.clear();
    messages_.push_back(std::move(system_message));
    messages_.push_back({"user", reanchor});
}

}  // namespace shellpilot::agent
