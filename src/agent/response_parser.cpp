#include "agent/response_parser.hpp"

#include "utils/common.hpp"

namespace shellpilot::agent {
namespace {

using shellpilot::utils::ToLower;
using shellpilot::utils::Trim;

std::string ActionOf(const nlohmann::json& object) {
    if (!object.is_object() || !object.contains("action") || !object["action"].is_string()) {
        return {};
    }
    return ToLower(Trim(object["action"].get<std::string>()));
}

bool Qualifies(const nlohmann::json& object) {
    return IsRecognizedAction(ActionOf(object));
}

std::string FieldText(const nlohmann::json& object, const char* key) {
    if (!object.contains(key) || object[key].is_null()) {
        return {};
    }
    const auto& value = object[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

// Index of the brace closing the one at `start`, ignoring braces inside
// string literals; npos when the text ends first.
std::size_t FindClosingBrace(const std::string& text, std::size_t start) {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (std::size_t i = start; i < text.size(); ++i) {
        const char ch = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                in_string = false;
            }
            continue;
        }
        if (ch == '"') {
            in_string = true;
        } else if (ch == '{') {
            ++depth;
        } else if (ch == '}') {
            --depth;
            if (depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

}  // namespace

bool IsRecognizedAction(const std::string& action) {
    return action == "run" || action == "done" || action == "ask" ||
        action == "search" || action == "fetch";
}

std::string StripCodeFence(const std::string& raw) {
    std::string text = Trim(raw);
    if (text.rfind("```", 0) == 0) {
        text.erase(0, 3);
        if (ToLower(text.substr(0, 4)) == "json") {
            text.erase(0, 4);
        }
        text = Trim(text);
    }
    if (text.size() >= 3 && text.compare(text.size() - 3, 3, "```") == 0) {
        text.erase(text.size() - 3);
        text = Trim(text);
    }
    return text;
}

std::optional<nlohmann::json> ExtractDecisionObject(const std::string& raw) {
    const auto text = StripCodeFence(raw);

    auto whole = nlohmann::json::parse(text, nullptr, false);
    if (!whole.is_discarded() && Qualifies(whole)) {
        return whole;
    }

    std::optional<nlohmann::json> best;
    for (std::size_t start = 0; start < text.size(); ++start) {
        if (text[start] != '{') {
            continue;
        }
        const auto end = FindClosingBrace(text, start);
        if (end == std::string::npos) {
            continue;
        }
        auto candidate = nlohmann::json::parse(text.substr(start, end - start + 1), nullptr, false);
        if (!candidate.is_discarded() && Qualifies(candidate)) {
            best = std::move(candidate);
        }
    }
    return best;
}

DecisionParse ParseDecision(const std::string& raw) {
    DecisionParse parse{};
    const auto object = ExtractDecisionObject(raw);
    if (!object) {
        parse.error = DecisionError::kNoObject;
        return parse;
    }

    const auto action = ActionOf(*object);
    if (action == "run") {
        RunAction run{Trim(FieldText(*object, "command")), FieldText(*object, "reason")};
        if (run.command.empty()) {
            parse.error = DecisionError::kEmptyCommand;
            return parse;
        }
        parse.decision = std::move(run);
    } else if (action == "done") {
        parse.decision = DoneAction{FieldText(*object, "summary")};
    } else if (action == "ask") {
        auto question = FieldText(*object, "question");
        parse.decision = AskAction{question.empty() ? "?" : question};
    } else if (action == "search") {
        parse.decision = SearchAction{Trim(FieldText(*object, "query")), FieldText(*object, "reason")};
    } else {
        parse.decision = FetchAction{Trim(FieldText(*object, "url")), FieldText(*object, "reason")};
    }
    parse.error = DecisionError::kNone;
    return parse;
}

}  // namespace shellpilot::agent
