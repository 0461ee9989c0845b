#pragma once
#include <string>
#include <vector>

namespace secscrub {

constexpr size_t MAX_COMMAND_ARGS = 100;

// Deletes traversal sequences, null bytes, script and template constructs, shell
// metacharacters and dangerous command words; folds homographs to Latin.
// Output is capped at MAX_INPUT_LENGTH bytes.
std::string sanitize_input(const std::string& input);

bool is_path_safe(const std::string& path);
bool is_path_safe(const char* path); // nullptr is unsafe
bool is_command_safe(const std::string& command);
bool is_command_safe(const char* command); // nullptr is vacuously safe
bool is_project_name_safe(const std::string& name);
bool is_project_name_safe(const char* name); // nullptr is unsafe

// Trims each argument and neutralizes unsafe ones (strict mode rejects them instead).
// Arguments still containing blanks or quotes are single-quoted. On failure out is
// cleared and error describes the reason without echoing the input.
bool sanitize_command_args(const std::vector<std::string>& args, std::vector<std::string>& out,
                           std::string& error, bool strict = true);

bool is_trusted_package_manager(const std::string& name);

}
