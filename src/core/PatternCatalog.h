#pragma once
#include "Severity.h"
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace secscrub {

enum class CodepointClass { CyrillicHomograph, GreekHomograph, Bidi, ZeroWidth, DotLookalike, SlashLookalike, NullByte };

// One analyzer check: any listed rule matching yields a single violation.
struct ThreatCheck {
    std::string type;     // e.g. "path-traversal"
    std::string pattern;  // e.g. "directory-traversal"
    Severity severity;
    int weight;
    std::string description;
    std::string recommendation;
    std::vector<const std::regex*> rules;
    std::vector<CodepointClass> codepoints;
    bool lookalike_traversal = false;
};

enum class DisclosureCategory { Injection, ApiKey, Password, DatabaseUrl, FilePath, NetworkInfo, PersonalInfo };

enum class RedactionStrategy {
    Delete,        // remove the match
    KeyValue,      // key=*** (quoted values keep their quotes)
    Connection,    // scheme://***@***
    UserDirectory, // /Users/*** keeping separators
    SensitiveFile, // ***.ext
    Network,       // IP mask, :***, host=***
    Fixed          // constant replacement text
};

struct DisclosureRule {
    std::string name;
    std::regex re;
    Severity severity;
    RedactionStrategy strategy;
    std::string fixed;
    bool extend_value = false; // swallow the rest of an unquoted value beyond the bounded match
};

class PatternCatalog {
public:
    PatternCatalog(const PatternCatalog&) = delete;
    PatternCatalog& operator=(const PatternCatalog&) = delete;

    // Named threat rule; throws std::out_of_range for unknown names.
    const std::regex& rule(const std::string& name) const;
    const std::vector<ThreatCheck>& threat_checks() const { return checks_; }
    const std::vector<DisclosureRule>& disclosure_rules(DisclosureCategory c) const;

    bool in_class(char32_t cp, CodepointClass c) const;
    bool has_codepoint(const std::string& s, CodepointClass c) const;
    std::string strip_codepoints(const std::string& s, CodepointClass c) const;
    // Map Cyrillic/Greek lookalikes to Latin where a counterpart exists, delete the rest.
    std::string fold_homographs(const std::string& s) const;

    // ".." + separator spelled with full-width/one-dot-leader variants or split by zero-width characters.
    bool has_lookalike_traversal(const std::string& s) const;
    std::string strip_lookalike_traversal(const std::string& s) const;

    bool is_project_name_char(char32_t cp) const;

private:
    PatternCatalog();
    friend const PatternCatalog& pattern_catalog();

    void add_rule(const std::string& name, const char* re, bool icase = false);
    void add_check(ThreatCheck check, const std::vector<std::string>& rule_names);
    void add_disclosure(DisclosureCategory c, const std::string& name, const std::string& re, Severity sev,
                        RedactionStrategy strategy, bool icase = true, bool extend = false, const std::string& fixed = "");
    void load_threat_rules();
    void load_disclosure_rules();

    std::map<std::string, std::regex> rules_;
    std::vector<ThreatCheck> checks_;
    std::map<DisclosureCategory, std::vector<DisclosureRule>> disclosure_;
};

// Process-wide immutable catalog, built on first use.
const PatternCatalog& pattern_catalog();

}
