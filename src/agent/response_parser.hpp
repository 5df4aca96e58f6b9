#pragma once

#include <optional>
#include <string>

#include "agent/decision.hpp"
#include "nlohmann/json.hpp"

namespace shellpilot::agent {

enum class DecisionError {
    kNone,
    kNoObject,
    kEmptyCommand
};

struct DecisionParse {
    std::optional<Decision> decision;
    DecisionError error = DecisionError::kNoObject;

    bool Ok() const { return decision.has_value(); }
};

bool IsRecognizedAction(const std::string& action);

// Removes an optional ``` / ```json wrapper and surrounding whitespace.
std::string StripCodeFence(const std::string& raw);

// Finds the object carrying a recognised "action" tag: the whole text if it
// parses, otherwise the last brace-balanced substring that does.
std::optional<nlohmann::json> ExtractDecisionObject(const std::string& raw);

// Never throws; a rejected or missing object is reported through the error.
DecisionParse ParseDecision(const std::string& raw);

}  // namespace shellpilot::agent
