#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace shellpilot::agent {

// Append-only message history whose first element is always the system
// message. Window() is what gets sent to the model.
class Conversation {
public:
    explicit Conversation(std::string system_prompt);

    void Append(const std::string& role, const std::string& content);
    void AppendUser(const std::string& content) { Append("user", content); }
    void AppendAssistant(const std::string& content) { Append("assistant", content); }

    // System message followed by at most the last `max_recent` other messages.
    std::vector<shellpilot::providers::Message> Window(std::size_t max_recent) const;

    // Drops everything except the system message and adds `reanchor` as the
    // only user message.
    void HardReset(const std::string& reanchor);

    const std::vector<shellpilot::providers::Message>& Messages() const { return messages_; }
    std::size_t Size() const { return messages_.size(); }

private:
    std::vector<shellpilot::providers::Message> messages_;
};

}  // namespace shellpilot::agent
