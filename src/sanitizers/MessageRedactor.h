#pragma once
#include "../core/Config.h"
#include "../core/PatternCatalog.h"
#include <string>

namespace secscrub {

constexpr const char* TRUNCATION_SUFFIX = "... [truncated for security]";

// Bounded redaction of a single message. Result never exceeds max_message_length bytes.
std::string sanitize_error_message(const std::string& message, const ErrorSanitizationConfig& config = {});

// Applies every rule of one disclosure category, left to right.
std::string redact_disclosures(const std::string& text, DisclosureCategory category);

}
