#include "ContextValue.h"
#include <cmath>
#include <ctime>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace secscrub {

ContextValue::ContextValue() = default;
ContextValue::ContextValue(std::nullptr_t) {}
ContextValue::ContextValue(bool b) : kind_(ValueKind::Boolean), bool_(b) {}
ContextValue::ContextValue(int n) : kind_(ValueKind::Number), number_(n) {}
ContextValue::ContextValue(long long n) : kind_(ValueKind::Number), number_(static_cast<double>(n)) {}
ContextValue::ContextValue(double n) : kind_(ValueKind::Number), number_(n) {}
ContextValue::ContextValue(const char* s) : kind_(s ? ValueKind::String : ValueKind::Null), text_(s ? s : "") {}
ContextValue::ContextValue(std::string s) : kind_(ValueKind::String), text_(std::move(s)) {}

ContextValue ContextValue::undefined(){ ContextValue v; v.kind_ = ValueKind::Undefined; return v; }
ContextValue ContextValue::big_int(std::string digits){ ContextValue v; v.kind_ = ValueKind::BigInt; v.text_ = std::move(digits); return v; }
ContextValue ContextValue::function(std::string name){ ContextValue v; v.kind_ = ValueKind::Function; v.text_ = std::move(name); return v; }
ContextValue ContextValue::symbol(std::string description){ ContextValue v; v.kind_ = ValueKind::Symbol; v.text_ = std::move(description); return v; }
ContextValue ContextValue::date(Clock::time_point tp){ ContextValue v; v.kind_ = ValueKind::Date; v.date_ = tp; return v; }
ContextValue ContextValue::buffer(size_t bytes){ ContextValue v; v.kind_ = ValueKind::Buffer; v.size_ = bytes; return v; }

ContextValue ContextValue::pattern(std::string source, std::string flags){
    ContextValue v;
    v.kind_ = ValueKind::Pattern;
    v.text_ = std::move(source);
    v.extra_ = std::move(flags);
    return v;
}

ContextValue ContextValue::object(){
    ContextValue v;
    v.kind_ = ValueKind::Object;
    v.node_ = std::make_shared<ContextNode>();
    return v;
}

ContextValue ContextValue::array(){
    ContextValue v;
    v.kind_ = ValueKind::Array;
    v.node_ = std::make_shared<ContextNode>();
    return v;
}

ContextValue& ContextValue::set(const std::string& key, ContextValue v){
    if(!is_object()) return *this;
    for(auto& m : node_->members){
        if(m.first == key){ m.second = std::move(v); return *this; }
    }
    node_->members.emplace_back(key, std::move(v));
    return *this;
}

const ContextValue* ContextValue::find(const std::string& key) const {
    if(!is_object()) return nullptr;
    for(const auto& m : node_->members) if(m.first == key) return &m.second;
    return nullptr;
}

bool ContextValue::erase(const std::string& key){
    if(!is_object()) return false;
    auto& ms = node_->members;
    for(auto it = ms.begin(); it != ms.end(); ++it){
        if(it->first == key){ ms.erase(it); return true; }
    }
    return false;
}

const std::vector<ContextValue::Member>& ContextValue::members() const {
    static const std::vector<Member> empty;
    return is_object() ? node_->members : empty;
}

ContextValue& ContextValue::push(ContextValue v){
    if(is_array()) node_->items.push_back(std::move(v));
    return *this;
}

const std::vector<ContextValue>& ContextValue::items() const {
    static const std::vector<ContextValue> empty;
    return is_array() ? node_->items : empty;
}

size_t ContextValue::size() const {
    if(is_object()) return node_->members.size();
    if(is_array()) return node_->items.size();
    return 0;
}

void ContextValue::clear(){
    if(!node_) return;
    // move out first: destroying children may release this very node through a cycle
    auto members = std::move(node_->members);
    auto items = std::move(node_->items);
    node_->members.clear();
    node_->items.clear();
}

std::string iso_timestamp(ContextValue::Clock::time_point tp){
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if(millis < 0){ millis += 1000; --secs; }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

std::string describe(const ContextValue& v){
    switch(v.kind()){
        case ValueKind::Undefined: return "[Undefined]";
        case ValueKind::BigInt: return "[BigInt: " + v.text() + "]";
        case ValueKind::Function: return "[Function: " + (v.text().empty() ? std::string("anonymous") : v.text()) + "]";
        case ValueKind::Symbol: return "[Symbol: Symbol(" + v.text() + ")]";
        case ValueKind::Pattern: return "[RegExp: /" + v.text() + "/" + v.pattern_flags() + "]";
        case ValueKind::Date: return iso_timestamp(v.as_date());
        case ValueKind::Buffer: return "[Buffer: " + std::to_string(v.byte_size()) + " bytes]";
        case ValueKind::Null: return "null";
        case ValueKind::Boolean: return v.as_bool() ? "true" : "false";
        case ValueKind::Number: return safe_dump(context_to_json(v));
        case ValueKind::String: return v.text();
        case ValueKind::Object: return "[Object]";
        case ValueKind::Array: return "[Array]";
    }
    return "[Unknown]";
}

namespace {

using Ancestors = std::unordered_set<const void*>;

nlohmann::ordered_json to_json_rec(const ContextValue& v, Ancestors& ancestors, int depth,
                                   std::vector<std::string>* warnings){
    switch(v.kind()){
        case ValueKind::Null: return nullptr;
        case ValueKind::Boolean: return v.as_bool();
        case ValueKind::Number:
            if(!std::isfinite(v.as_number())) return nullptr;
            // integral values inside the exact double range serialize without a fraction
            if(std::floor(v.as_number()) == v.as_number() && std::fabs(v.as_number()) <= 9007199254740991.0)
                return static_cast<long long>(v.as_number());
            return v.as_number();
        case ValueKind::String: return v.text();
        case ValueKind::Object:
        case ValueKind::Array: break;
        default: return describe(v);
    }
    if(ancestors.count(v.identity())){
        if(warnings) warnings->push_back("Circular reference replaced during serialization");
        return "[Circular]";
    }
    if(depth >= MAX_CONTEXT_DEPTH){
        if(warnings) warnings->push_back("Context nesting exceeds maximum depth");
        return "[Max depth exceeded]";
    }
    ancestors.insert(v.identity());
    nlohmann::ordered_json out;
    if(v.is_object()){
        out = nlohmann::ordered_json::object();
        for(const auto& m : v.members()) out[m.first] = to_json_rec(m.second, ancestors, depth + 1, warnings);
    } else {
        out = nlohmann::ordered_json::array();
        for(const auto& item : v.items()) out.push_back(to_json_rec(item, ancestors, depth + 1, warnings));
    }
    ancestors.erase(v.identity());
    return out;
}

} // namespace

nlohmann::ordered_json context_to_json(const ContextValue& v, std::vector<std::string>* warnings){
    Ancestors ancestors;
    return to_json_rec(v, ancestors, 0, warnings);
}

ContextValue context_from_json(const nlohmann::ordered_json& j){
    switch(j.type()){
        case nlohmann::ordered_json::value_t::null: return ContextValue();
        case nlohmann::ordered_json::value_t::boolean: return ContextValue(j.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer: return ContextValue(j.get<long long>());
        case nlohmann::ordered_json::value_t::number_unsigned: {
            unsigned long long u = j.get<unsigned long long>();
            if(u > 9007199254740991ULL) return ContextValue::big_int(std::to_string(u));
            return ContextValue(static_cast<long long>(u));
        }
        case nlohmann::ordered_json::value_t::number_float: return ContextValue(j.get<double>());
        case nlohmann::ordered_json::value_t::string: return ContextValue(j.get<std::string>());
        case nlohmann::ordered_json::value_t::array: {
            ContextValue arr = ContextValue::array();
            for(const auto& item : j) arr.push(context_from_json(item));
            return arr;
        }
        case nlohmann::ordered_json::value_t::object: {
            ContextValue obj = ContextValue::object();
            for(auto it = j.begin(); it != j.end(); ++it) obj.set(it.key(), context_from_json(it.value()));
            return obj;
        }
        case nlohmann::ordered_json::value_t::binary: return ContextValue::buffer(j.get_binary().size());
        default: return ContextValue::undefined();
    }
}

std::string safe_dump(const nlohmann::ordered_json& j, int indent){
    return j.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

ErrorInfo ErrorInfo::from_exception(const std::exception& ex){
    ErrorInfo info;
    info.message = ex.what();
    if(auto se = dynamic_cast<const std::system_error*>(&ex)){
        info.name = "SystemError";
        info.code = std::string(se->code().category().name()) + ":" + std::to_string(se->code().value());
        info.properties.set("errno", se->code().value());
    } else if(dynamic_cast<const std::invalid_argument*>(&ex)){
        info.name = "InvalidArgument";
    } else if(dynamic_cast<const std::out_of_range*>(&ex)){
        info.name = "RangeError";
    } else if(dynamic_cast<const std::logic_error*>(&ex)){
        info.name = "LogicError";
    } else if(dynamic_cast<const std::runtime_error*>(&ex)){
        info.name = "RuntimeError";
    }
    return info;
}

}
