#include <pformat/matcher.hpp>
#include <pformat/format_spec.hpp>
#include <pformat/log.hpp>
#include <re2/re2.h>

namespace pformat {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static RE2::Options quiet_options() {
    RE2::Options opts;
    opts.set_log_errors(false);
    return opts;
}

// Capture class implied by a format spec's presentation type
static std::string typed_pattern(const std::string& spec, const std::string& fallback) {
    auto type = spec_type(spec);
    if (!type) return fallback;
    switch (*type) {
    case 'd':
    case 'n': return R"([-+]?\d+)";
    case 'x':
    case 'X': return "[0-9a-fA-F]+";
    case 'o': return "[0-7]+";
    case 'b': return "[01]+";
    case 'c': return ".";
    case '%': return R"([-+]?\d+(?:\.\d*)?%)";
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G': return R"([-+]?(?:\d+(?:\.\d*)?|\.\d+)(?:[eE][-+]?\d+)?|[-+]?(?:inf|nan))";
    default:  return fallback;
    }
}

static std::string join_regex(const std::vector<std::string>& parts, size_t count) {
    std::string s;
    for (size_t i = 0; i < count; ++i) s += parts[i];
    return s;
}

// ---------------------------------------------------------------------------
// ReverseMatcher
// ---------------------------------------------------------------------------

Result<ReverseMatcher> ReverseMatcher::compile(const Template& tmpl,
                                               const MatchOptions& opts) {
    ReverseMatcher m;
    m.source_ = tmpl.source();

    size_t field_index = 0;
    for (const auto& seg : tmpl.segments()) {
        Piece piece;
        if (auto lit = std::get_if<Literal>(&seg)) {
            piece.regex = RE2::QuoteMeta(lit->text);
            piece.description = "literal '" + lit->text + "'";
            piece.literal = lit->text;
        } else {
            const auto& field = std::get<FieldRef>(seg);
            std::string inner;
            if (field.inline_constraint) {
                inner = *field.inline_constraint;

                RE2 check(inner, quiet_options());
                if (!check.ok()) {
                    PformatError e{PformatError::BadPattern,
                        "invalid constraint in field " + field.raw_span + ": " + check.error(),
                        tmpl.source(), static_cast<int>(field.offset)};
                    return e;
                }
            } else if (opts.typed_captures) {
                inner = typed_pattern(field.format_spec, opts.default_pattern);
            } else {
                inner = opts.default_pattern;
            }
            piece.key = field.key();
            piece.group = "pf" + std::to_string(field_index++);
            piece.regex = "(?P<" + piece.group + ">" + inner + ")";
            piece.description = "field '" + field.key() + "'";
        }
        m.pattern_ += piece.regex;
        m.pieces_.push_back(std::move(piece));
    }

    auto re = std::make_shared<const RE2>(m.pattern_, quiet_options());
    if (!re->ok()) {
        return PformatError{PformatError::BadPattern,
            "template does not compile to a valid pattern: " + re->error(),
            tmpl.source(), -1};
    }
    m.regex_ = std::move(re);

    log::debug("compiled reverse pattern for '%s': %s",
               m.source_.c_str(), m.pattern_.c_str());
    return Result<ReverseMatcher>::ok(std::move(m));
}

Result<Captures> ReverseMatcher::match(const std::string& candidate) const {
    const int ngroups = regex_->NumberOfCapturingGroups();
    std::vector<re2::StringPiece> groups(static_cast<size_t>(ngroups) + 1);

    if (!regex_->Match(candidate, 0, candidate.size(), RE2::ANCHOR_BOTH,
                       groups.data(), ngroups + 1)) {
        return mismatch(candidate);
    }

    const auto& names = regex_->NamedCapturingGroups();
    Captures captures;
    for (const auto& piece : pieces_) {
        if (piece.group.empty()) continue;

        const auto& sp = groups[static_cast<size_t>(names.at(piece.group))];
        std::string text(sp.data(), sp.size());

        auto [it, inserted] = captures.emplace(piece.key, text);
        if (!inserted && it->second != text) {
            PformatError e{PformatError::PatternMismatch,
                "field '" + piece.key + "' captured '" + text +
                    "' but an earlier occurrence captured '" + it->second + "'",
                candidate, static_cast<int>(sp.data() - candidate.data())};
            e.expected = piece.description + " = '" + it->second + "'";
            return e;
        }
    }

    return Result<Captures>::ok(std::move(captures));
}

static size_t common_prefix(const std::string& a, const std::string& b, size_t b_from) {
    size_t n = 0;
    while (n < a.size() && b_from + n < b.size() && a[n] == b[b_from + n]) ++n;
    return n;
}

// Find the first segment at which the candidate stops matching: the longest
// prefix of pieces that still matches at the start of the candidate. When
// that segment is a literal, the position is moved to the end of the
// preceding prefix where the literal matches furthest (a lazy field would
// otherwise report the shortest split).
PformatError ReverseMatcher::mismatch(const std::string& candidate) const {
    std::vector<std::string> parts;
    parts.reserve(pieces_.size());
    for (const auto& p : pieces_) parts.push_back(p.regex);

    size_t matched_end = 0;
    size_t failed = pieces_.size();
    for (size_t k = 1; k <= pieces_.size(); ++k) {
        RE2 prefix(join_regex(parts, k), quiet_options());
        re2::StringPiece m;
        if (!prefix.ok() ||
            !prefix.Match(candidate, 0, candidate.size(), RE2::ANCHOR_START, &m, 1)) {
            failed = k - 1;
            break;
        }
        matched_end = m.size();
    }

    std::string expected = "end of input";
    if (failed < pieces_.size()) {
        const Piece& next = pieces_[failed];
        expected = next.description;

        if (failed > 0 && next.group.empty()) {
            RE2 before(join_regex(parts, failed), quiet_options());
            size_t best = 0;
            for (size_t end = matched_end; before.ok() && end <= candidate.size(); ++end) {
                size_t n = common_prefix(next.literal, candidate, end);
                if (n == 0 || n < best) continue;
                if (before.Match(candidate, 0, end, RE2::ANCHOR_BOTH, nullptr, 0)) {
                    best = n;
                    matched_end = end;
                }
            }
        }
    }

    log::debug("'%s' diverges from '%s' at offset %zu (expected %s)",
               candidate.c_str(), source_.c_str(), matched_end, expected.c_str());

    PformatError e{PformatError::PatternMismatch,
        "'" + candidate + "' does not match template '" + source_ + "'",
        candidate, static_cast<int>(matched_end)};
    e.expected = expected;
    return e;
}

// ---------------------------------------------------------------------------
// Forward validation
// ---------------------------------------------------------------------------

Status validate(const Template& tmpl, const Bindings& bindings) {
    for (const FieldRef* field : tmpl.fields()) {
        if (!field->inline_constraint) continue;

        auto value = lookup(bindings, field->key_path);
        if (!value) continue;

        Value v = field->conversion ? apply_conversion(*value, *field->conversion)
                                    : std::move(*value);
        auto text = apply_format_spec(v, field->format_spec);
        if (text.is_err()) {
            PformatError e = std::move(text).error();
            e.source = tmpl.source();
            e.position = static_cast<int>(field->offset);
            return e;
        }

        RE2 re(*field->inline_constraint, quiet_options());
        if (!re.ok()) {
            return PformatError{PformatError::BadPattern,
                "invalid constraint in field " + field->raw_span + ": " + re.error(),
                tmpl.source(), static_cast<int>(field->offset)};
        }
        if (!RE2::FullMatch(text.value(), re)) {
            PformatError e{PformatError::ConstraintViolation,
                "value '" + text.value() + "' of field '" + field->path_string() +
                    "' does not match /" + *field->inline_constraint + "/",
                tmpl.source(), static_cast<int>(field->offset)};
            return e;
        }
    }
    return ok_status();
}

} // namespace pformat
