#include "Utils.h"
#include <algorithm>
#include <cctype>

namespace secscrub {
namespace utils {

std::vector<CodePoint> decode_utf8(const std::string& s){
    std::vector<CodePoint> out;
    out.reserve(s.size());
    size_t i = 0;
    while(i < s.size()){
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        char32_t cp = c;
        if(c >= 0xC2 && c <= 0xDF) { len = 2; cp = c & 0x1F; }
        else if(c >= 0xE0 && c <= 0xEF) { len = 3; cp = c & 0x0F; }
        else if(c >= 0xF0 && c <= 0xF4) { len = 4; cp = c & 0x07; }
        bool ok = len > 1 && i + len <= s.size();
        for(size_t k = 1; ok && k < len; ++k){
            unsigned char cc = static_cast<unsigned char>(s[i+k]);
            if((cc & 0xC0) != 0x80) ok = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        if(len > 1 && !ok){ len = 1; cp = c; }
        out.push_back({cp, i, len});
        i += len;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp){
    if(cp < 0x80) out.push_back(static_cast<char>(cp));
    else if(cp < 0x800){
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if(cp < 0x10000){
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string utf8_prefix(const std::string& s, size_t max_bytes){
    if(s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    // back off over continuation bytes so the lead byte is dropped with them
    while(cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> split_lines(const std::string& s){
    std::vector<std::string> lines;
    size_t start = 0;
    for(;;){
        size_t nl = s.find('\n', start);
        if(nl == std::string::npos){ lines.push_back(s.substr(start)); break; }
        lines.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines){
    std::string out;
    for(size_t i = 0; i < lines.size(); ++i){
        if(i) out += '\n';
        out += lines[i];
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix){
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& s, const std::string& needle){
    return s.find(needle) != std::string::npos;
}

std::string replace_each(const std::string& input, const std::regex& re, const MatchReplacer& fn){
    std::string out;
    auto last = input.cbegin();
    for(std::sregex_iterator it(input.begin(), input.end(), re), end; it != end; ++it){
        const std::smatch& m = *it;
        out.append(last, m[0].first);
        out += fn(m);
        last = m[0].second;
    }
    out.append(last, input.cend());
    return out;
}

} // namespace utils
} // namespace secscrub
