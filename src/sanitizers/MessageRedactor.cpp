#include "MessageRedactor.h"
#include "../core/ConfigValidator.h"
#include "../core/Utils.h"
#include <cctype>
#include <cstddef>
#include <regex>

namespace secscrub {

namespace {

bool is_value_char(char c){
    return !std::isspace(static_cast<unsigned char>(c)) && c != ',' && c != ';' && c != '}' && c != ')' &&
           c != '"' && c != '\'';
}

bool is_quote(char c){ return c == '"' || c == '\''; }

constexpr size_t MAX_QUOTED_TAIL = 512;

// Open: the closing quote lies past the end of the match.
enum class ValueQuote { None, Closed, Open };

// key=***, or key: "***" when the value was quoted
std::string redact_key_value(const std::string& text, ValueQuote& quote){
    quote = ValueQuote::None;
    size_t sep = text.find_first_of("=:");
    if(text.size() >= 2 && is_quote(text.front()) && text.back() == text.front() && sep == std::string::npos){
        quote = ValueQuote::Closed;
        return std::string(1, text.front()) + "***" + text.front();
    }
    if(sep == std::string::npos) sep = text.find('-');
    if(sep == std::string::npos) return "***";
    size_t v = sep + 1;
    while(v < text.size() && std::isspace(static_cast<unsigned char>(text[v]))) ++v;
    if(v < text.size() && is_quote(text[v])){
        quote = text.find(text[v], v + 1) == std::string::npos ? ValueQuote::Open : ValueQuote::Closed;
        return text.substr(0, v + 1) + "***" + text[v];
    }
    return text.substr(0, sep) + "=***";
}

std::string redact_sensitive_file(const std::string& text){
    size_t last_sep = text.find_last_of("/\\");
    std::string base = last_sep == std::string::npos ? text : text.substr(last_sep + 1);
    std::string ext;
    size_t dot = base.find_last_of('.');
    if(dot != std::string::npos && dot > 0) ext = base.substr(dot);
    std::string lead = (!text.empty() && (text[0] == '/' || text[0] == '\\')) ? text.substr(0, 1) : "";
    return lead + "***" + ext;
}

std::string redact_network(const std::string& text, ValueQuote& quote){
    static const std::regex ipv4(R"((?:\d{1,3}\.){3}\d{1,3})");
    quote = ValueQuote::None;
    if(std::regex_match(text, ipv4)) return "***.***.***.***";
    if(!text.empty() && text[0] == ':') return ":***";
    size_t lh = text.find("localhost:");
    if(lh == 0) return "localhost:***";
    return redact_key_value(text, quote);
}

std::string redact_match(const DisclosureRule& rule, const std::string& text, ValueQuote& quote){
    quote = ValueQuote::None;
    switch(rule.strategy){
        case RedactionStrategy::Delete: return "";
        case RedactionStrategy::KeyValue: return redact_key_value(text, quote);
        case RedactionStrategy::Connection: {
            size_t scheme = text.find("://");
            std::string out = text.substr(0, scheme) + "://***";
            if(text.find('@') != std::string::npos) out += "@***";
            return out;
        }
        case RedactionStrategy::UserDirectory: {
            size_t last_sep = text.find_last_of("/\\");
            return text.substr(0, last_sep + 1) + "***";
        }
        case RedactionStrategy::SensitiveFile: return redact_sensitive_file(text);
        case RedactionStrategy::Network: return redact_network(text, quote);
        case RedactionStrategy::Fixed: return rule.fixed;
    }
    return "***";
}

std::string apply_rule(const std::string& input, const DisclosureRule& rule){
    std::string out;
    auto pos = input.cbegin();
    const auto end = input.cend();
    auto flags = std::regex_constants::match_default;
    std::smatch m;
    while(pos != end && std::regex_search(pos, end, m, rule.re, flags)){
        auto match_end = m[0].second;
        out.append(pos, m[0].first);
        ValueQuote quote = ValueQuote::None;
        out += redact_match(rule, m.str(0), quote);
        if(quote == ValueQuote::Open){
            // swallow the rest of the quoted value, up to its closing quote on the same line
            const char q = out.back();
            for(auto it = match_end; it != end && it - match_end < static_cast<std::ptrdiff_t>(MAX_QUOTED_TAIL); ++it){
                if(*it == '\n') break;
                if(*it == q){ match_end = it + 1; break; }
            }
        } else if(rule.extend_value && quote == ValueQuote::None){
            while(match_end != end && is_value_char(*match_end)) ++match_end;
        }
        if(m[0].length() == 0){
            if(match_end == end) { pos = end; break; }
            out.push_back(*match_end);
            ++match_end;
        }
        pos = match_end;
        flags = std::regex_constants::match_prev_avail;
    }
    out.append(pos, end);
    return out;
}

} // namespace

std::string redact_disclosures(const std::string& text, DisclosureCategory category){
    std::string s = text;
    for(const auto& rule : pattern_catalog().disclosure_rules(category)){
        s = apply_rule(s, rule);
    }
    return s;
}

std::string sanitize_error_message(const std::string& message, const ErrorSanitizationConfig& config){
    if(message.empty()) return "";
    ErrorSanitizationConfig cfg = config;
    ConfigValidator::normalize(cfg);
    const size_t limit = static_cast<size_t>(cfg.max_message_length);

    std::string s = utils::utf8_prefix(message, limit * 3);
    s = redact_disclosures(s, DisclosureCategory::Injection);

    if(!cfg.custom_patterns.empty()){
        std::vector<PatternWarning> warnings;
        for(const auto& re : ConfigValidator::compile_patterns(cfg.custom_patterns, warnings)){
            s = std::regex_replace(s, re, "***");
        }
    }

    if(cfg.redact_api_keys) s = redact_disclosures(s, DisclosureCategory::ApiKey);
    if(cfg.redact_passwords) s = redact_disclosures(s, DisclosureCategory::Password);
    if(cfg.redact_database_urls) s = redact_disclosures(s, DisclosureCategory::DatabaseUrl);
    if(cfg.redact_file_paths) s = redact_disclosures(s, DisclosureCategory::FilePath);
    if(cfg.redact_network_info) s = redact_disclosures(s, DisclosureCategory::NetworkInfo);
    if(cfg.redact_personal_info) s = redact_disclosures(s, DisclosureCategory::PersonalInfo);

    if(message.size() > limit * 2) s = utils::utf8_prefix(s, limit * 2);
    if(s.size() > limit){
        const std::string suffix = TRUNCATION_SUFFIX;
        if(limit > suffix.size()) s = utils::utf8_prefix(s, limit - suffix.size()) + suffix;
        else s = utils::utf8_prefix(s, limit);
    }
    return s;
}

}
