#pragma once
#include <string>
#include <vector>
#include <regex>
#include <functional>

namespace secscrub {
namespace utils {

// One decoded code point and the byte span it occupied.
struct CodePoint {
    char32_t value;
    size_t offset;
    size_t length;
};

// Decodes UTF-8 leniently: an invalid byte becomes a single code point with its raw value.
std::vector<CodePoint> decode_utf8(const std::string& s);
void append_utf8(std::string& out, char32_t cp);

// Longest prefix of at most max_bytes that does not split a UTF-8 sequence.
std::string utf8_prefix(const std::string& s, size_t max_bytes);

std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split_lines(const std::string& s);
std::string join_lines(const std::vector<std::string>& lines);
bool starts_with(const std::string& s, const std::string& prefix);
bool contains(const std::string& s, const std::string& needle);

using MatchReplacer = std::function<std::string(const std::smatch&)>;

// regex_replace with a per-match callback (all matches, left to right).
std::string replace_each(const std::string& input, const std::regex& re, const MatchReplacer& fn);

} // namespace utils
} // namespace secscrub
