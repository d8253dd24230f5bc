#pragma once

#include <pformat/lang/field.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pformat {

// Dynamically typed binding value. Objects keep member insertion order.
class Value {
public:
    enum Kind { Null, Bool, Int, Float, String, List, Object };

    Value() : kind_(Null) {}
    Value(bool b) : kind_(Bool), bool_(b) {}
    Value(int i) : kind_(Int), int_(i) {}
    Value(long i) : kind_(Int), int_(i) {}
    Value(long long i) : kind_(Int), int_(i) {}
    Value(double d) : kind_(Float), float_(d) {}
    Value(const char* s) : kind_(String), string_(s) {}
    Value(std::string s) : kind_(String), string_(std::move(s)) {}

    static Value null();
    static Value list(std::vector<Value> items);
    static Value object(std::vector<std::pair<std::string, Value>> members);

    Kind kind() const { return kind_; }
    bool is_null() const { return kind_ == Null; }
    bool is_number() const { return kind_ == Int || kind_ == Float; }

    bool as_bool() const { return bool_; }
    int64_t as_int() const { return int_; }
    double as_float() const { return float_; }
    const std::string& as_string() const { return string_; }
    const std::vector<Value>& items() const { return children_; }
    const std::vector<std::string>& keys() const { return keys_; }

    // Object member by name, or nullptr
    const Value* member(const std::string& name) const;

    // One container traversal step (Object member or List item); nullptr
    // when the step does not apply. String indexing is handled by lookup().
    const Value* step(const KeyComponent& comp) const;

    // Host-style text conversions
    std::string str() const;
    std::string repr() const;
    std::string ascii() const;

    static const char* kind_name(Kind k);

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    Kind kind_;
    bool bool_ = false;
    int64_t int_ = 0;
    double float_ = 0.0;
    std::string string_;
    std::vector<std::string> keys_;    // Object member names
    std::vector<Value> children_;      // List items / Object member values
};

using Bindings = std::unordered_map<std::string, Value>;

// Follow a key path through the bindings. Returns nullopt when the field is
// missing: unknown key, unknown attribute, index out of range or a step that
// does not apply to the value's kind.
std::optional<Value> lookup(const Bindings& bindings, const KeyPath& path);

} // namespace pformat
