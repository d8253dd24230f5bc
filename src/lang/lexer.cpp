#include <pformat/lang/lexer.hpp>

namespace pformat {

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

struct Lexer {
    const std::string& source;
    size_t pos;

    std::vector<RawSegment> segments;
    std::string literal;
    size_t literal_start;

    explicit Lexer(const std::string& src)
        : source(src), pos(0), literal_start(0) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    void append_literal(char c) {
        if (literal.empty()) literal_start = pos;
        literal.push_back(c);
    }

    void flush_literal() {
        if (literal.empty()) return;
        segments.push_back({RawSegment::Literal, std::move(literal), literal_start});
        literal.clear();
    }

    PformatError error_at(size_t at, std::string msg, std::string hint = {}) const {
        PformatError e{PformatError::UnbalancedBrace, std::move(msg),
                       source, static_cast<int>(at)};
        e.hint = std::move(hint);
        return e;
    }

    Result<std::vector<RawSegment>> run() {
        while (!at_end()) {
            char c = peek();

            if (c == '{' && peek_next() == '{') {
                append_literal('{');
                pos += 2;
                continue;
            }
            if (c == '}' && peek_next() == '}') {
                append_literal('}');
                pos += 2;
                continue;
            }
            if (c == '}') {
                return error_at(pos, "single '}' encountered in template",
                                "use '}}' for a literal brace");
            }
            if (c == '{') {
                auto end = scan_field();
                if (end.is_err()) return std::move(end).error();
                flush_literal();
                size_t start = pos;
                pos = end.value();
                segments.push_back({RawSegment::Field,
                                    source.substr(start, pos - start), start});
                continue;
            }

            append_literal(c);
            ++pos;
        }

        flush_literal();
        return Result<std::vector<RawSegment>>::ok(std::move(segments));
    }

    // Find the end (one past '}') of the field opened at pos.
    // Brackets are only tracked in the key path, before '!' or ':'.
    Result<size_t> scan_field() const {
        size_t i = pos + 1;
        int depth = 0;
        bool in_tail = false;

        while (i < source.size()) {
            char c = source[i];

            if (depth > 0) {
                if (c == '\\' && i + 1 < source.size()) {
                    i += 2;
                    continue;
                }
                if (c == '[') ++depth;
                else if (c == ']') --depth;
                ++i;
                continue;
            }

            if (c == '}') return Result<size_t>::ok(i + 1);
            if (c == '{') {
                return error_at(i, "unexpected '{' inside field",
                                "fields cannot nest; use '{{' for a literal brace");
            }
            if (!in_tail) {
                if (c == '[') depth = 1;
                else if (c == '!' || c == ':') in_tail = true;
            }
            ++i;
        }

        return error_at(pos, "unmatched '{' in template",
                        "use '{{' for a literal brace");
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<std::vector<RawSegment>> tokenize(const std::string& source) {
    Lexer lexer(source);
    return lexer.run();
}

} // namespace pformat
