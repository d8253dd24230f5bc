#include <pformat/lang/field.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace pformat {

// ---------------------------------------------------------------------------
// Rendering helpers
// ---------------------------------------------------------------------------

std::string FieldRef::path_string() const {
    std::string s;
    for (const auto& comp : key_path) {
        switch (comp.kind) {
        case KeyComponent::Name:
            s += comp.text;
            break;
        case KeyComponent::Attribute:
            s += "." + comp.text;
            break;
        case KeyComponent::Index:
        case KeyComponent::Item:
            s += "[" + comp.text + "]";
            break;
        }
    }
    return s;
}

std::string FieldRef::to_string(const SyntaxOptions& opts) const {
    std::string s = "{" + path_string();
    if (inline_default) {
        s += "." + opts.default_marker + "[" + *inline_default + "]";
    }
    if (inline_constraint) {
        s += "." + opts.constraint_marker + "[" + *inline_constraint + "]";
    }
    if (conversion) {
        s += "!";
        s += *conversion;
    }
    if (!format_spec.empty()) {
        s += ":" + format_spec;
    }
    s += "}";
    return s;
}

// ---------------------------------------------------------------------------
// Field parser
// ---------------------------------------------------------------------------

namespace {

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

struct FieldParser {
    const std::string& inner;   // text between the braces
    size_t base;                // template offset of inner[0]
    const std::string& source;
    const SyntaxOptions& opts;

    FieldParser(const std::string& in, size_t b, const std::string& src,
                const SyntaxOptions& o)
        : inner(in), base(b), source(src), opts(o) {}

    PformatError error_at(PformatError::Code code, size_t at, std::string msg) const {
        return PformatError{code, std::move(msg), source, static_cast<int>(base + at)};
    }

    // Index of the ']' closing the '[' at `open`, or npos
    size_t matching_bracket(size_t open, size_t end) const {
        int depth = 0;
        for (size_t i = open; i < end; ++i) {
            char c = inner[i];
            if (c == '\\' && i + 1 < end) {
                ++i;
                continue;
            }
            if (c == '[') ++depth;
            else if (c == ']' && --depth == 0) return i;
        }
        return std::string::npos;
    }

    // End of the key path: first '!' or ':' outside brackets
    size_t key_path_end() const {
        size_t i = 0;
        while (i < inner.size()) {
            char c = inner[i];
            if (c == '[') {
                size_t close = matching_bracket(i, inner.size());
                if (close == std::string::npos) return inner.size();
                i = close + 1;
                continue;
            }
            if (c == '!' || c == ':') return i;
            ++i;
        }
        return inner.size();
    }

    // Read a bare name starting at i, stopping at '.' or '['
    Result<std::string> read_name(size_t& i, size_t end) const {
        size_t start = i;
        while (i < end && inner[i] != '.' && inner[i] != '[') {
            if (inner[i] == ']') {
                return error_at(PformatError::MalformedKeyPath, i,
                    "unexpected ']' in key path");
            }
            ++i;
        }
        return Result<std::string>::ok(inner.substr(start, i - start));
    }

    Result<KeyPath> parse_key_path(size_t end) const {
        KeyPath path;
        size_t i = 0;

        auto name = read_name(i, end);
        if (name.is_err()) return std::move(name).error();
        path.push_back({KeyComponent::Name, std::move(name).value(), 0});

        while (i < end) {
            if (inner[i] == '.') {
                size_t dot = i++;
                auto attr = read_name(i, end);
                if (attr.is_err()) return std::move(attr).error();
                if (attr.value().empty()) {
                    return error_at(PformatError::MalformedKeyPath, dot,
                        "empty attribute in key path");
                }
                path.push_back({KeyComponent::Attribute, std::move(attr).value(), 0});
                continue;
            }

            // inner[i] == '['
            size_t close = matching_bracket(i, end);
            if (close == std::string::npos) {
                return error_at(PformatError::MalformedKeyPath, i,
                    "missing ']' in key path");
            }
            std::string text = inner.substr(i + 1, close - i - 1);
            bool after_marker = path.back().kind == KeyComponent::Attribute &&
                                (path.back().text == opts.default_marker ||
                                 path.back().text == opts.constraint_marker);
            if (text.empty() && !after_marker) {
                return error_at(PformatError::MalformedKeyPath, i,
                    "empty index in key path");
            }

            KeyComponent comp{KeyComponent::Item, text, 0};
            if (is_all_digits(text)) {
                errno = 0;
                unsigned long long idx = std::strtoull(text.c_str(), nullptr, 10);
                if (errno != ERANGE) {
                    comp.kind = KeyComponent::Index;
                    comp.index = static_cast<size_t>(idx);
                }
            }
            path.push_back(std::move(comp));

            i = close + 1;
            if (i < end && inner[i] != '.' && inner[i] != '[') {
                return error_at(PformatError::MalformedKeyPath, i,
                    "only '.' or '[' may follow ']' in key path");
            }
        }

        return Result<KeyPath>::ok(std::move(path));
    }

    // Strip trailing ._[default] / ._re[pattern] components, in either order
    Status extract_encodings(KeyPath& path, FieldRef& field) const {
        for (int pass = 0; pass < 2 && path.size() >= 3; ++pass) {
            const auto& marker = path[path.size() - 2];
            const auto& arg = path.back();
            if (marker.kind != KeyComponent::Attribute ||
                (arg.kind != KeyComponent::Index && arg.kind != KeyComponent::Item)) {
                break;
            }

            if (marker.text == opts.default_marker) {
                if (field.inline_default) {
                    return error_at(PformatError::MalformedEncoding, 0,
                        "field has more than one inline default");
                }
                if (arg.text.find_first_of("[]") != std::string::npos) {
                    return error_at(PformatError::MalformedEncoding, 0,
                        "inline default may not contain brackets");
                }
                field.inline_default = arg.text;
            } else if (marker.text == opts.constraint_marker) {
                if (field.inline_constraint) {
                    return error_at(PformatError::MalformedEncoding, 0,
                        "field has more than one inline constraint");
                }
                if (arg.text.empty()) {
                    return error_at(PformatError::MalformedEncoding, 0,
                        "inline constraint is empty");
                }
                field.inline_constraint = arg.text;
            } else {
                break;
            }

            path.pop_back();
            path.pop_back();
        }
        return ok_status();
    }

    Status parse_tail(size_t i, FieldRef& field) const {
        if (i >= inner.size()) return ok_status();

        if (inner[i] == '!') {
            if (i + 1 >= inner.size()) {
                return error_at(PformatError::BadConversion, i,
                    "missing conversion character after '!'");
            }
            char conv = inner[i + 1];
            if (conv != 's' && conv != 'r' && conv != 'a') {
                return error_at(PformatError::BadConversion, i + 1,
                    std::string("unknown conversion '") + conv + "'");
            }
            field.conversion = conv;
            i += 2;
            if (i < inner.size() && inner[i] != ':') {
                return error_at(PformatError::BadConversion, i,
                    "expected ':' after conversion");
            }
        }

        if (i < inner.size()) {
            // inner[i] == ':'
            field.format_spec = inner.substr(i + 1);
        }
        return ok_status();
    }

    Result<FieldRef> run() const {
        FieldRef field;

        size_t kp_end = key_path_end();
        auto path = parse_key_path(kp_end);
        if (path.is_err()) return std::move(path).error();

        KeyPath key_path = std::move(path).value();
        PFORMAT_TRY(extract_encodings(key_path, field));

        if (key_path.front().text.empty()) {
            PformatError e = error_at(PformatError::EmptyKeyPath, 0,
                "field has no key");
            e.hint = "name the field, e.g. {name}; positional fields are not supported";
            return e;
        }
        field.key_path = std::move(key_path);

        PFORMAT_TRY(parse_tail(kp_end, field));
        return Result<FieldRef>::ok(std::move(field));
    }
};

} // anonymous namespace

Result<FieldRef> parse_field(const std::string& raw_span,
                             size_t offset,
                             const std::string& source,
                             const SyntaxOptions& opts) {
    if (raw_span.size() < 2 || raw_span.front() != '{' || raw_span.back() != '}') {
        return PformatError{PformatError::UnbalancedBrace,
            "field span must be enclosed in braces", source, static_cast<int>(offset)};
    }

    std::string inner = raw_span.substr(1, raw_span.size() - 2);
    FieldParser parser(inner, offset + 1, source, opts);
    auto field = parser.run();
    if (field.is_err()) return field;

    field.value().raw_span = raw_span;
    field.value().offset = offset;
    return field;
}

} // namespace pformat
