#include <pformat/value.hpp>
#include <fmt/format.h>
#include <cmath>

namespace pformat {

Value Value::null() {
    return Value();
}

Value Value::list(std::vector<Value> items) {
    Value v;
    v.kind_ = List;
    v.children_ = std::move(items);
    return v;
}

Value Value::object(std::vector<std::pair<std::string, Value>> members) {
    Value v;
    v.kind_ = Object;
    for (auto& [k, val] : members) {
        v.keys_.push_back(std::move(k));
        v.children_.push_back(std::move(val));
    }
    return v;
}

const char* Value::kind_name(Kind k) {
    switch (k) {
        case Null:   return "null";
        case Bool:   return "bool";
        case Int:    return "int";
        case Float:  return "float";
        case String: return "string";
        case List:   return "list";
        case Object: return "object";
    }
    return "unknown";
}

const Value* Value::member(const std::string& name) const {
    if (kind_ != Object) return nullptr;
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == name) return &children_[i];
    }
    return nullptr;
}

const Value* Value::step(const KeyComponent& comp) const {
    switch (comp.kind) {
    case KeyComponent::Name:
    case KeyComponent::Attribute:
    case KeyComponent::Item:
        return member(comp.text);
    case KeyComponent::Index:
        if (kind_ == List) {
            return comp.index < children_.size() ? &children_[comp.index] : nullptr;
        }
        return member(comp.text);
    }
    return nullptr;
}

bool Value::operator==(const Value& o) const {
    if (kind_ != o.kind_) return false;
    switch (kind_) {
    case Null:   return true;
    case Bool:   return bool_ == o.bool_;
    case Int:    return int_ == o.int_;
    case Float:  return float_ == o.float_;
    case String: return string_ == o.string_;
    case List:   return children_ == o.children_;
    case Object: return keys_ == o.keys_ && children_ == o.children_;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Text conversions
// ---------------------------------------------------------------------------

static std::string float_text(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    // Shortest round-trip form, always with a '.' or exponent: 3.0, 0.1, 1e+16
    std::string s = fmt::format("{}", d);
    if (s.find_first_of(".e") == std::string::npos) s += ".0";
    return s;
}

static std::string quote(const std::string& s, bool ascii_only) {
    char q = (s.find('\'') != std::string::npos && s.find('"') == std::string::npos)
        ? '"' : '\'';
    std::string out(1, q);
    for (unsigned char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c == static_cast<unsigned char>(q)) {
                out += '\\';
                out += static_cast<char>(c);
            } else if (c < 0x20 || c == 0x7f || (ascii_only && c >= 0x80)) {
                out += fmt::format("\\x{:02x}", c);
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    out += q;
    return out;
}

static std::string container_text(const Value& v, bool ascii_only) {
    auto elem = [&](const Value& e) { return ascii_only ? e.ascii() : e.repr(); };
    std::string s;
    if (v.kind() == Value::List) {
        s = "[";
        for (size_t i = 0; i < v.items().size(); ++i) {
            if (i > 0) s += ", ";
            s += elem(v.items()[i]);
        }
        return s + "]";
    }
    s = "{";
    for (size_t i = 0; i < v.keys().size(); ++i) {
        if (i > 0) s += ", ";
        s += quote(v.keys()[i], ascii_only) + ": " + elem(v.items()[i]);
    }
    return s + "}";
}

std::string Value::str() const {
    switch (kind_) {
    case Null:   return "None";
    case Bool:   return bool_ ? "True" : "False";
    case Int:    return std::to_string(int_);
    case Float:  return float_text(float_);
    case String: return string_;
    case List:
    case Object: return container_text(*this, false);
    }
    return "";
}

std::string Value::repr() const {
    if (kind_ == String) return quote(string_, false);
    return str();
}

std::string Value::ascii() const {
    switch (kind_) {
    case String: return quote(string_, true);
    case List:
    case Object: return container_text(*this, true);
    default:     return str();
    }
}

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

std::optional<Value> lookup(const Bindings& bindings, const KeyPath& path) {
    if (path.empty()) return std::nullopt;
    auto it = bindings.find(path.front().text);
    if (it == bindings.end()) return std::nullopt;

    const Value* cur = &it->second;
    Value holder;
    for (size_t i = 1; i < path.size(); ++i) {
        const auto& comp = path[i];
        if (comp.kind == KeyComponent::Index && cur->kind() == Value::String) {
            const auto& s = cur->as_string();
            if (comp.index >= s.size()) return std::nullopt;
            holder = Value(std::string(1, s[comp.index]));
            cur = &holder;
            continue;
        }
        cur = cur->step(comp);
        if (!cur) return std::nullopt;
    }
    return *cur;
}

} // namespace pformat
