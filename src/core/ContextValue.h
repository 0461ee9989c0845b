#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace secscrub {

enum class ValueKind { Undefined, Null, Boolean, Number, BigInt, String, Object, Array, Function, Symbol, Pattern, Date, Buffer };

struct ContextNode;

// Diagnostic value of any kind an error context may carry. Objects and arrays are
// shared nodes, so copies alias and cyclic graphs can be built.
class ContextValue {
public:
    using Member = std::pair<std::string, ContextValue>;
    using Clock = std::chrono::system_clock;

    ContextValue();
    ContextValue(std::nullptr_t);
    ContextValue(bool b);
    ContextValue(int n);
    ContextValue(long long n);
    ContextValue(double n);
    ContextValue(const char* s);
    ContextValue(std::string s);

    static ContextValue undefined();
    static ContextValue big_int(std::string digits);
    static ContextValue function(std::string name = "");
    static ContextValue symbol(std::string description = "");
    static ContextValue pattern(std::string source, std::string flags = "");
    static ContextValue date(Clock::time_point tp);
    static ContextValue buffer(size_t bytes);
    static ContextValue object();
    static ContextValue array();

    ValueKind kind() const { return kind_; }
    bool is_object() const { return kind_ == ValueKind::Object; }
    bool is_array() const { return kind_ == ValueKind::Array; }
    bool is_string() const { return kind_ == ValueKind::String; }
    bool is_container() const { return is_object() || is_array(); }

    bool as_bool() const { return bool_; }
    double as_number() const { return number_; }
    // string value, big-int digits, function name, symbol description or pattern source
    const std::string& text() const { return text_; }
    const std::string& pattern_flags() const { return extra_; }
    size_t byte_size() const { return size_; }
    Clock::time_point as_date() const { return date_; }

    // Object members keep insertion order; set() replaces an existing key in place.
    ContextValue& set(const std::string& key, ContextValue v);
    const ContextValue* find(const std::string& key) const;
    bool erase(const std::string& key);
    const std::vector<Member>& members() const;

    ContextValue& push(ContextValue v);
    const std::vector<ContextValue>& items() const;

    size_t size() const;
    void clear();

    const void* identity() const { return node_.get(); }

private:
    ValueKind kind_ = ValueKind::Null;
    bool bool_ = false;
    double number_ = 0;
    std::string text_;
    std::string extra_;
    size_t size_ = 0;
    Clock::time_point date_{};
    std::shared_ptr<ContextNode> node_;
};

struct ContextNode {
    std::vector<ContextValue::Member> members;
    std::vector<ContextValue> items;
};

constexpr int MAX_CONTEXT_DEPTH = 32;

// Placeholder text for kinds JSON cannot carry ("[BigInt: 12]", "[Buffer: 4 bytes]", ...).
std::string describe(const ContextValue& v);

// Describe-then-serialize. Cycles become "[Circular]" and depth beyond MAX_CONTEXT_DEPTH
// becomes "[Max depth exceeded]"; both are reported through warnings when given.
nlohmann::ordered_json context_to_json(const ContextValue& v, std::vector<std::string>* warnings = nullptr);
ContextValue context_from_json(const nlohmann::ordered_json& j);

// dump() that never throws on invalid UTF-8.
std::string safe_dump(const nlohmann::ordered_json& j, int indent = -1);

std::string iso_timestamp(ContextValue::Clock::time_point tp);

struct ErrorInfo {
    std::string name = "Error";
    std::string message;
    std::string stack;
    std::optional<std::string> code;
    ContextValue properties = ContextValue::object(); // own properties besides name/message/stack

    static ErrorInfo from_exception(const std::exception& ex);
};

}
