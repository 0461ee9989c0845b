#include "StackTraceRedactor.h"
#include "MessageRedactor.h"
#include "../core/ConfigValidator.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cctype>
#include <regex>

namespace secscrub {

namespace {

struct Replacement {
    std::regex re;
    const char* format;
};

std::regex rx(const char* pattern, bool icase = false){
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if(icase) flags |= std::regex::icase;
    return std::regex(pattern, flags);
}

std::string apply_all(std::string s, const std::vector<Replacement>& table){
    for(const auto& r : table) s = std::regex_replace(s, r.re, r.format);
    return s;
}

// Keeps a match untouched when it sits inside an existing "[...]" marker.
std::string replace_unless_bracketed(const std::string& s, const std::regex& re, const std::string& with){
    std::string out;
    auto pos = s.cbegin();
    for(std::sregex_iterator it(s.begin(), s.end(), re), end; it != end; ++it){
        const auto& m = *it;
        out.append(pos, m[0].first);
        bool bracketed = m[0].first != s.cbegin() && *(m[0].first - 1) == '[';
        out += bracketed ? m.str(0) : with;
        pos = m[0].second;
    }
    out.append(pos, s.cend());
    return out;
}

// Replaces each marker match with `replacement` and swallows the following characters until stop().
template<typename Stop>
std::string redact_after(const std::string& s, const std::regex& marker, const std::string& replacement, Stop stop){
    std::string out;
    auto pos = s.cbegin();
    const auto end = s.cend();
    auto flags = std::regex_constants::match_default;
    std::smatch m;
    while(pos != end && std::regex_search(pos, end, m, marker, flags)){
        out.append(pos, m[0].first);
        out += replacement;
        auto next = m[0].second;
        while(next != end && !stop(next, end)) ++next;
        pos = next;
        flags = std::regex_constants::match_prev_avail;
    }
    out.append(pos, end);
    return out;
}

bool is_unix_name_stop(std::string::const_iterator it, std::string::const_iterator){
    char c = *it;
    return c == '/' || c == '\n' || c == '\r' || c == '\t' || c == ' ' || c == ')' || c == ':';
}

bool is_windows_path_stop(std::string::const_iterator it, std::string::const_iterator end){
    char c = *it;
    if(std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')' || c == '"' || c == '\'') return true;
    // keep :line:col
    return c == ':' && (it + 1) != end && std::isdigit(static_cast<unsigned char>(*(it + 1)));
}

std::string strip_control_chars(const std::string& s){
    std::string out;
    out.reserve(s.size());
    for(size_t i = 0; i < s.size(); ++i){
        unsigned char c = static_cast<unsigned char>(s[i]);
        if((c < 0x20 && c != '\n' && c != '\t' && c != '\r') || c == 0x7F) continue;
        // C1 controls U+0080..U+009F
        if(c == 0xC2 && i + 1 < s.size()){
            unsigned char n = static_cast<unsigned char>(s[i+1]);
            if(n >= 0x80 && n <= 0x9F){ ++i; continue; }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string normalize_node_modules(const std::string& s){
    static const std::regex unix_re(
        R"((?:/[^/\n\r\t ()]{1,100}){0,16}/node_modules/([^\\/\n\r\t )]{1,100})(?:/{1,8}([^\\/\n\r\t )]{1,100}))?)");
    static const std::regex win_re(
        R"([A-Za-z]:(?:\\[^\\\n\r\t ()]{1,100}){0,16}\\node_modules\\([^\\/\n\r\t )]{1,100})(?:\\{1,8}([^\\/\n\r\t )]{1,100}))?)");
    auto canonical = [](const std::smatch& m){
        std::string out = "node_modules/" + m.str(1);
        if(m[2].matched) out += "/" + m.str(2);
        return out;
    };
    return utils::replace_each(utils::replace_each(s, unix_re, canonical), win_re, canonical);
}

std::string neutralize_traversal(const std::string& s){
    static const std::vector<Replacement> table = [](){
        std::vector<Replacement> t;
        t.push_back({rx(R"(\.\.[\\/])"), "[PATH-TRAVERSAL]/"});
        t.push_back({rx(R"([\\/]\.\.(?=\r?\n|$))"), "/[PATH-TRAVERSAL]"});
        return t;
    }();
    return apply_all(s, table);
}

std::string redact_home_directories(const std::string& s){
    static const std::regex mac(R"(/Users/)");
    static const std::regex linux_home(R"(/home/)");
    static const std::regex windows(R"([A-Za-z]:[\\/]{1,2}Users[\\/]{1,2})", std::regex::ECMAScript | std::regex::icase);
    std::string out = redact_after(s, mac, "/Users/***", is_unix_name_stop);
    out = redact_after(out, linux_home, "/home/***", is_unix_name_stop);
    return redact_after(out, windows, "C:\\Users\\***", is_windows_path_stop);
}

std::string redact_system_directories(const std::string& s){
    static const std::vector<Replacement> table = [](){
        std::vector<Replacement> t;
        t.push_back({rx(R"([\\/](etc|root|opt|var|usr|bin|sbin)[\\/][^\\/\n\r\t ]{0,256})"), "/$1/***"});
        t.push_back({rx(R"(C:[\\/](Windows|Program Files|ProgramData)[\\/][^\\/\n\r\t ]{0,256})", true), "C:\\$1\\***"});
        return t;
    }();
    std::vector<std::string> lines = utils::split_lines(s);
    for(auto& line : lines){
        if(utils::contains(line, "node_modules")) continue;
        line = apply_all(line, table);
    }
    return utils::join_lines(lines);
}

std::string redact_project_directories(const std::string& s){
    static const std::vector<Replacement> table = [](){
        std::vector<Replacement> t;
        t.push_back({rx(R"([\\/](workspace|project|src|dist|build)[\\/][^\\/\n\r\t )]{0,256})"), "/$1/***"});
        t.push_back({rx(R"(/mnt/[^/\n\r\t ):]{1,128}/[^/\n\r\t ):]{1,128})"), "/mnt/***/***"});
        return t;
    }();
    return apply_all(s, table);
}

std::string redact_devices(const std::string& s){
    static const std::vector<Replacement> table = [](){
        std::vector<Replacement> t;
        t.push_back({rx(R"(\\\\\?\\)"), R"(\\[DEVICE]\)"});
        t.push_back({rx(R"(\\\\\.\\[^\\\s)]{1,128})"), R"(\\.\[DEVICE])"});
        t.push_back({rx(R"(\\\\[^\\\s?.][^\\\s]{0,127}\\[^\\\s)]{1,128})"), R"(\\[SERVER]\[SHARE])"});
        t.push_back({rx(R"(\b[A-Za-z]:\\(?=\r?\n|$))"), R"([DRIVE]:\)"});
        t.push_back({rx(R"(/dev/[^/\s)]{1,64})"), "/dev/[DEVICE]"});
        return t;
    }();
    static const std::regex dangerous(R"(\b(?:PhysicalDrive\d{0,3}|GLOBALROOT|Device|CON|PRN|AUX|NUL)\b)",
                                      std::regex::ECMAScript | std::regex::icase);
    return replace_unless_bracketed(apply_all(s, table), dangerous, "[DEVICE]");
}

std::string redact_sensitive_files(const std::string& s){
    static const std::regex re(R"(passwd|shadow|hosts|secrets\.txt|\.env|\.ssh)", std::regex::ECMAScript | std::regex::icase);
    return std::regex_replace(s, re, "[REDACTED]");
}

std::string redact_build_directories(const std::string& s){
    static const std::regex re(R"([\\/](dist|build|out)[\\/][^\\/\n\r\t ):]{0,256})");
    return std::regex_replace(s, re, "/$1/***");
}

std::string strip_source_maps(const std::string& s, bool suffixes){
    std::vector<std::string> lines = utils::split_lines(s);
    for(auto& line : lines){
        size_t p = line.find("//# sourceMappingURL=");
        if(p != std::string::npos) line.erase(p);
        p = line.find("/*# sourceMappingURL=");
        if(p != std::string::npos){
            size_t close = line.find("*/", p);
            line.erase(p, close == std::string::npos ? std::string::npos : close + 2 - p);
        }
        if(!suffixes) continue;
        for(const char* ext : {".js.map", ".ts.map"}){
            size_t q;
            while((q = line.find(ext)) != std::string::npos) line.erase(q + 3, 4);
        }
    }
    return utils::join_lines(lines);
}

std::string sanitize_module_names(const std::string& s){
    static const std::vector<Replacement> table = [](){
        std::vector<Replacement> t;
        t.push_back({rx(R"(@[^/\s()@]{1,100}/[^/\s)]{1,100})"), "@***/***"});
        t.push_back({rx(R"(\binternal/[^/\s)]{1,100})"), "internal/***"});
        t.push_back({rx(R"(\blib/[^/\s)]{1,100})"), "lib/***"});
        t.push_back({rx(R"(\bsrc/[^/\s)]{1,100})"), "src/***"});
        return t;
    }();
    return apply_all(s, table);
}

std::string remove_line_columns(const std::string& s){
    static const std::regex re(R"(:\d{1,6}:\d{1,6})");
    return std::regex_replace(s, re, "");
}

std::string limit_depth(const std::string& s, int max_depth, const std::string& note){
    std::vector<std::string> lines = utils::split_lines(s);
    size_t depth = static_cast<size_t>(max_depth);
    if(lines.size() <= depth) return s;
    size_t hidden = lines.size() - depth;
    lines.resize(depth);
    return utils::join_lines(lines) + "\n... [" + std::to_string(hidden) + note + "]";
}

// Splits s into pieces of at most STACK_CHUNK_SIZE bytes, cut after the last newline
// that fits or else on a code point boundary. The pieces concatenate back to s.
std::vector<std::string> chunk_text(const std::string& s){
    std::vector<std::string> chunks;
    size_t pos = 0;
    while(pos < s.size()){
        size_t len = s.size() - pos;
        if(len > STACK_CHUNK_SIZE){
            size_t nl = s.rfind('\n', pos + STACK_CHUNK_SIZE - 1);
            if(nl != std::string::npos && nl >= pos){
                len = nl + 1 - pos;
            } else {
                len = utils::utf8_prefix(s.substr(pos, STACK_CHUNK_SIZE + 1), STACK_CHUNK_SIZE).size();
                if(len == 0) len = STACK_CHUNK_SIZE;
            }
        }
        chunks.push_back(s.substr(pos, len));
        pos += len;
    }
    return chunks;
}

std::string sanitize_minimal(const std::string& stack, const ErrorSanitizationConfig& cfg){
    static const std::vector<Replacement> frame_table = [](){
        std::vector<Replacement> t;
        t.push_back({rx(R"(/[^/\s()]{1,50}(?=/))"), ""});
        t.push_back({rx(R"(\\[^\\\s()]{1,50}(?=\\))"), ""});
        t.push_back({rx(R"(:\d{1,6}:\d{1,6})"), ""});
        t.push_back({rx(R"(\([^)]{0,200}node_modules[^)]{0,200}\))"), "(node_modules)"});
        t.push_back({rx(R"(\([^)/\\]{0,100}[/\\][^)]{0,100}\))"), "(internal)"});
        return t;
    }();
    static const std::regex line_number(R"(:\d{1,6})");

    std::vector<std::string> lines = utils::split_lines(stack);
    std::string head = lines.front();
    if(cfg.redact_file_paths) head = redact_disclosures(head, DisclosureCategory::FilePath);
    for(size_t i = 1; i < lines.size(); ++i){
        if(!utils::starts_with(utils::trim(lines[i]), "at ")) continue;
        std::string frame = apply_all(lines[i], frame_table);
        if(cfg.remove_line_numbers) frame = std::regex_replace(frame, line_number, "");
        return head + "\n" + frame;
    }
    return head;
}

std::string sanitize_full(const std::string& stack, const ErrorSanitizationConfig& cfg){
    static const std::regex ssh_dir(R"((/Users|/home)/[^/\s]{1,128}/\.ssh)");
    static const std::regex env_file(R"(\.env\b)");
    static const std::regex secret_word(R"(password|secret|key|token)", std::regex::ECMAScript | std::regex::icase);
    std::string s = stack;
    if(cfg.remove_source_maps) s = strip_source_maps(s, false);
    if(cfg.redact_file_paths){
        s = std::regex_replace(s, ssh_dir, "$1/***/[hidden]");
        s = std::regex_replace(s, env_file, "[env-file]");
        std::string out;
        auto pos = s.cbegin();
        for(std::sregex_iterator it(s.begin(), s.end(), secret_word), end; it != end; ++it){
            const auto& m = *it;
            out.append(pos, m[0].first);
            bool bracketed = m[0].first != s.cbegin() && *(m[0].first - 1) == '[';
            out += bracketed ? m.str(0) : "[" + utils::to_lower(m.str(0)) + "]";
            pos = m[0].second;
        }
        out.append(pos, s.cend());
        s = out;
    }
    return limit_depth(s, cfg.max_stack_depth, " more frames, use higher maxStackDepth for full trace");
}

std::string sanitize_full_pipeline(const std::string& stack, const ErrorSanitizationConfig& cfg){
    std::string s = stack;
    if(cfg.redact_file_paths){
        if(stack.size() > STACK_CHUNK_THRESHOLD){
            // control characters are stripped per chunk; path rules need the rejoined text
            Logger::instance().debug("stack: processing " + std::to_string(stack.size()) + " bytes in chunks");
            s.clear();
            for(const auto& chunk : chunk_text(stack)) s += strip_control_chars(chunk);
        }
        s = sanitize_stack_paths(s);
    }
    if(cfg.remove_source_maps) s = strip_source_maps(s, true);
    if(cfg.sanitize_module_names) s = sanitize_module_names(s);
    if(cfg.remove_line_numbers) s = remove_line_columns(s);
    return limit_depth(s, cfg.max_stack_depth, " more frames hidden for security");
}

} // namespace

std::string collapse_repeated_chars(const std::string& text){
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while(i < text.size()){
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t j = i + 1;
        if(std::isalpha(c)){
            int lc = std::tolower(c);
            while(j < text.size() && std::tolower(static_cast<unsigned char>(text[j])) == lc) ++j;
        }
        if(j - i >= REPEATED_CHAR_RUN) out += "[REPEATED-CHARS]";
        else out.append(text, i, j - i);
        i = j;
    }
    return out;
}

std::string sanitize_stack_paths(const std::string& text){
    std::string s = strip_control_chars(text);
    s = normalize_node_modules(s);
    s = neutralize_traversal(s);
    s = redact_home_directories(s);
    s = redact_system_directories(s);
    s = redact_project_directories(s);
    s = redact_devices(s);
    s = redact_sensitive_files(s);
    s = redact_build_directories(s);
    return collapse_repeated_chars(s);
}

std::string sanitize_stack_trace(const std::string& stack, const ErrorSanitizationConfig& config){
    if(stack.empty()) return "";
    ErrorSanitizationConfig cfg = config;
    ConfigValidator::normalize(cfg);

    std::string s = stack;
    bool truncated = false;
    if(s.size() > MAX_STACK_INPUT){
        Logger::instance().warn("stack: input of " + std::to_string(stack.size()) + " bytes truncated to " +
                                std::to_string(MAX_STACK_INPUT));
        s = utils::utf8_prefix(s, MAX_STACK_INPUT);
        truncated = true;
    }

    std::string out;
    switch(cfg.stack_trace_level){
        case StackTraceLevel::None: return "";
        case StackTraceLevel::Minimal: return sanitize_minimal(s, cfg);
        case StackTraceLevel::Sanitized: out = sanitize_full_pipeline(s, cfg); break;
        case StackTraceLevel::Full: out = sanitize_full(s, cfg); break;
    }
    if(truncated) out += "\n... [Stack trace truncated for security]";
    return out;
}

}
