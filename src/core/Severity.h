#pragma once
#include <string>

namespace secscrub {

enum class Severity { Low, Medium, High, Critical };

const char* severity_to_string(Severity s);
// -1 when unknown; case-insensitive
int severity_rank(const std::string& sev);
bool parse_severity(const std::string& sev, Severity& out);

}
