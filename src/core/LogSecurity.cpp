#include "LogSecurity.h"
#include "PatternCatalog.h"
#include "Utils.h"
#include <regex>

namespace secscrub {

namespace {

const std::regex& ansi_re(){
    static const std::regex re(R"(\x1b\[[0-9;?]{0,32}[A-Za-z])");
    return re;
}

const std::regex& format_re(){
    static const std::regex re(R"(%[diouxXeEfFgGaAcspn%])");
    return re;
}

const std::regex& whitespace_flood_re(){
    static const std::regex re(R"([ \t]{10,64})");
    return re;
}

bool is_stripped_control(unsigned char c){
    return (c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7F;
}

} // namespace

std::string sanitize_log_output(const std::string& text){
    if(text.empty()) return text;
    std::string s = std::regex_replace(utils::utf8_prefix(text, MAX_LOG_LINE * 2), ansi_re(), "");

    std::string stripped;
    stripped.reserve(s.size());
    for(size_t i = 0; i < s.size(); ++i){
        unsigned char c = static_cast<unsigned char>(s[i]);
        if(is_stripped_control(c)) continue;
        if(c == '\r' && i + 1 < s.size() && s[i+1] == '\n'){ stripped += " [CRLF] "; ++i; continue; }
        if(c == '\r'){ stripped += " [CR] "; continue; }
        if(c == '\n'){ stripped += " [LF] "; continue; }
        stripped.push_back(static_cast<char>(c));
    }

    s = pattern_catalog().strip_codepoints(stripped, CodepointClass::Bidi);
    s = std::regex_replace(s, format_re(), "[FORMAT]");
    s = std::regex_replace(s, whitespace_flood_re(), " [WHITESPACE] ");

    if(s.size() > MAX_LOG_LINE){
        s = utils::utf8_prefix(s, MAX_LOG_LINE) + "...[truncated]";
    }
    return s;
}

LogSecurityReport analyze_log_security(const std::string& text){
    LogSecurityReport rep;
    std::string window = utils::utf8_prefix(text, MAX_LOG_LINE * 5);
    if(std::regex_search(window, ansi_re())){
        rep.has_ansi = true;
        rep.issues.push_back("ANSI escape sequences present");
    }
    for(unsigned char c : window){
        if(c == '\r' || c == '\n') rep.has_line_injection = true;
        else if(is_stripped_control(c)) rep.has_control_chars = true;
    }
    // ESC of an ANSI sequence is a control character too; report it once as ANSI
    if(rep.has_ansi && rep.has_control_chars){
        std::string without = std::regex_replace(window, ansi_re(), "");
        rep.has_control_chars = false;
        for(unsigned char c : without) if(is_stripped_control(c)) { rep.has_control_chars = true; break; }
    }
    if(rep.has_control_chars) rep.issues.push_back("Control characters present");
    if(rep.has_line_injection) rep.issues.push_back("Line break injection possible");
    if(std::regex_search(window, format_re())){
        rep.has_format_specifiers = true;
        rep.issues.push_back("Format string specifiers present");
    }
    if(rep.has_line_injection || rep.has_ansi) rep.risk_level = Severity::High;
    else if(rep.has_control_chars || rep.has_format_specifiers) rep.risk_level = Severity::Medium;
    return rep;
}

}
