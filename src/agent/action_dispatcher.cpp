#include "agent/action_dispatcher.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <variant>
#include <vector>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace shellpilot::agent {
namespace {

using shellpilot::exec::CommandResult;
using shellpilot::exec::ExecStatus;
using shellpilot::utils::Log;
using shellpilot::utils::LogLevel;

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr std::uintmax_t kSuspectDownloadBytes = 1024;

constexpr const char* kPromptMarkers[] = {
    "[y/n]",
    "(y/n)",
    "[yes/no]",
    "(yes/no)",
    "do you want to continue",
    "are you sure",
    "password:",
    "press enter",
    "press any key",
    "overwrite?"
};

// Whitespace split that keeps single- and double-quoted words together.
std::vector<std::string> SplitWords(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    char quote = 0;
    for (char ch : command) {
        if (quote != 0) {
            if (ch == quote) {
                quote = 0;
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == '\'' || ch == '"') {
            quote = ch;
        } else if (std::isspace(static_cast<unsigned char>(ch)) || ch == ';' || ch == '&' || ch == '|') {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

// Output file of a curl -o / wget -O style download, empty when the command
// is not one.
std::string DownloadTarget(const std::string& command) {
    const auto words = SplitWords(command);
    bool is_curl = false;
    bool is_wget = false;
    std::string target;
    for (std::size_t i = 0; i < words.size(); ++i) {
        const auto name = std::filesystem::path(words[i]).filename().string();
        if (name == "curl") {
            is_curl = true;
            continue;
        }
        if (name == "wget") {
            is_wget = true;
            continue;
        }
        const auto& word = words[i];
        const bool has_next = i + 1 < words.size();
        if (is_curl && (word == "-o" || word == "--output") && has_next) {
            target = words[++i];
        } else if (is_curl && word.rfind("--output=", 0) == 0) {
            target = word.substr(9);
        } else if (is_wget && word == "-O" && has_next) {
            target = words[++i];
        } else if (is_wget && word.rfind("--output-document=", 0) == 0) {
            target = word.substr(18);
        }
    }
    return target == "-" ? std::string() : target;
}

bool LooksInteractive(const CommandResult& result) {
    const auto text = shellpilot::utils::ToLower(result.output + "\n" + result.error);
    for (const char* marker : kPromptMarkers) {
        if (text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void AppendStreams(std::ostringstream& oss, const std::string& command, const CommandResult& result) {
    oss << "Command: " << command << "\n";
    oss << "stdout:\n" << result.output << "\n";
    oss << "stderr:\n" << result.error << "\n\n";
}

}  // namespace

ActionDispatcher::ActionDispatcher(const shellpilot::exec::CommandExecutor& executor,
                                   tools::ToolRegistry& tools,
                                   const AgentHooks& hooks)
    : executor_(executor)
    , tools_(tools)
    , hooks_(hooks) {}

RunAssessment ActionDispatcher::AssessRun(const std::string& command,
                                          const CommandResult& result,
                                          const std::string& working_dir) {
    RunAssessment assessment{};
    if (!result.Succeeded()) {
        assessment.kind = result.status != ExecStatus::kSpawnError && LooksInteractive(result)
            ? RunClassification::kInteractive
            : RunClassification::kFailure;
        return assessment;
    }

    const auto target = DownloadTarget(command);
    if (!target.empty()) {
        std::filesystem::path path(target);
        if (path.is_relative()) {
            path = std::filesystem::path(working_dir) / path;
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (!ec && size < kSuspectDownloadBytes) {
            assessment.kind = RunClassification::kSuspectDownload;
            assessment.download_path = path.string();
            assessment.download_size = size;
            return assessment;
        }
    }
    assessment.kind = RunClassification::kSuccess;
    return assessment;
}

std::string ActionDispatcher::BuildRunFeedback(const std::string& command,
                                               const CommandResult& result,
                                               const RunAssessment& assessment) {
    std::ostringstream oss;
    switch (assessment.kind) {
        case RunClassification::kSuccess:
            oss << "RESULT: SUCCESS\n";
            AppendStreams(oss, command, result);
            oss << "Is the full task now complete?\n"
                << "- Yes: {\"action\":\"done\",\"summary\":\"...\"}\n"
                << "- No:  next command as JSON. Do NOT ask questions.";
            break;
        case RunClassification::kSuspectDownload:
            oss << "RESULT: SUSPICIOUS (exit 0, but " << assessment.download_path << " is only "
                << assessment.download_size << " bytes; it is probably an error page, not the file)\n";
            AppendStreams(oss, command, result);
            oss << "Inspect the file (head/cat) and fix the URL or follow redirects (curl -L).\n"
                << "Do NOT repeat this command unchanged. JSON only.";
            break;
        case RunClassification::kInteractive:
            oss << "RESULT: FAILED (exit " << result.ExitLabel()
                << ") - the command stopped at an interactive prompt.\n";
            AppendStreams(oss, command, result);
            oss << "Commands cannot answer prompts. Do NOT repeat this command unchanged.\n"
                << "Re-run it non-interactively (-y, --yes, --assume-yes, or pipe from yes).\n"
                << "JSON only.";
            break;
        case RunClassification::kFailure:
            oss << "RESULT: FAILED (exit " << result.ExitLabel() << ")\n";
            AppendStreams(oss, command, result);
            oss << "Do NOT repeat this command.\n"
                << "Try something simpler. For file moves use:\n"
                << "{\"action\":\"run\",\"command\":\"for f in /path/*.ext; do mv \\\"$f\\\" /dest/; done\","
                << "\"reason\":\"...\"}\n"
                << "JSON only.";
            break;
    }
    return oss.str();
}

DispatchResult ActionDispatcher::Dispatch(const Decision& decision,
                                          const std::string& raw,
                                          Conversation& conversation,
                                          int step) {
    if (hooks_.on_decision) {
        hooks_.on_decision(step, decision);
    }
    Log(LogLevel::kDebug, "agent", "step=" + std::to_string(step) + " action=" + ActionName(decision));

    DispatchResult result{};
    std::string feedback;
    std::visit(Overloaded{
        [&](const RunAction& action) { feedback = HandleRun(action); },
        [&](const DoneAction& action) {
            result.completed = true;
            result.summary = action.summary;
        },
        [&](const AskAction& action) { feedback = HandleAsk(action); },
        [&](const SearchAction& action) { feedback = HandleSearch(action); },
        [&](const FetchAction& action) { feedback = HandleFetch(action); }
    }, decision);

    if (!result.completed) {
        conversation.AppendAssistant(raw);
        conversation.AppendUser(feedback);
    }
    return result;
}

std::string ActionDispatcher::HandleRun(const RunAction& action) {
    if (hooks_.on_command_start) {
        hooks_.on_command_start(action.command);
    }
    const auto result = executor_.Run(action.command, hooks_.on_output_line);
    if (hooks_.on_command_end) {
        hooks_.on_command_end(result);
    }
    const auto assessment = AssessRun(action.command, result, executor_.Options().working_dir);
    return BuildRunFeedback(action.command, result, assessment);
}

std::string ActionDispatcher::HandleAsk(const AskAction& action) {
    std::string answer;
    if (hooks_.ask_user) {
        answer = shellpilot::utils::Trim(hooks_.ask_user(action.question));
    }
    if (answer.empty()) {
        answer = "(no answer given; use your best judgement)";
    }
    return answer + "\n\nContinue task now. Do NOT ask more questions. JSON only.";
}

std::string ActionDispatcher::HandleSearch(const SearchAction& action) {
    if (action.query.empty()) {
        return "Empty query. Give {\"action\":\"search\",\"query\":\"...\",\"reason\":\"...\"}.";
    }
    if (!tools_.Has("web_search")) {
        return "Web search is unavailable in this session. "
            "Proceed using your own knowledge and shell commands. JSON only.";
    }
    const auto output = tools_.Execute("web_search", {{"query", action.query}});
    if (tools::IsToolError(output)) {
        return "Web search failed (" + output + "). "
            "Proceed using your own knowledge and shell commands. JSON only.";
    }
    return "SEARCH RESULTS for \"" + action.query + "\":\n" + output +
        "\n\nContinue the task. JSON only.";
}

std::string ActionDispatcher::HandleFetch(const FetchAction& action) {
    if (action.url.empty()) {
        return "Empty url. Give {\"action\":\"fetch\",\"url\":\"...\",\"reason\":\"...\"}.";
    }
    if (!tools_.Has("web_fetch")) {
        return "Fetching URLs is unavailable in this session. "
            "Proceed using your own knowledge and shell commands. JSON only.";
    }
    const auto output = tools_.Execute("web_fetch", {{"url", action.url}});
    if (tools::IsToolError(output)) {
        return "Fetch failed (" + output + "). "
            "Proceed using your own knowledge and shell commands. JSON only.";
    }
    return "PAGE CONTENT of " + action.url + ":\n" + output +
        "\n\nContinue the task. JSON only.";
}

}  // namespace shellpilot::agent
