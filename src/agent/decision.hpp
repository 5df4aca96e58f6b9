#pragma once

#include <string>
#include <variant>

namespace shellpilot::agent {

struct RunAction {
    std::string command;
    std::string reason;
};

struct DoneAction {
    std::string summary;
};

struct AskAction {
    std::string question;
};

struct SearchAction {
    std::string query;
    std::string reason;
};

struct FetchAction {
    std::string url;
    std::string reason;
};

using Decision = std::variant<RunAction, DoneAction, AskAction, SearchAction, FetchAction>;

// Wire name of the decision's "action" tag.
inline const char* ActionName(const Decision& decision) {
    switch (decision.index()) {
        case 0: return "run";
        case 1: return "done";
        case 2: return "ask";
        case 3: return "search";
        case 4: return "fetch";
    }
    return "unknown";
}

}  // namespace shellpilot::agent
