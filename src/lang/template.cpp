#include <pformat/lang/template.hpp>
#include <pformat/lang/lexer.hpp>

namespace pformat {

Result<Template> Template::parse(const std::string& source, const SyntaxOptions& opts) {
    auto raw = tokenize(source);
    if (raw.is_err()) return std::move(raw).error();

    Template tmpl;
    tmpl.source_ = source;
    tmpl.segments_.reserve(raw.value().size());

    for (auto& seg : raw.value()) {
        if (seg.kind == RawSegment::Literal) {
            tmpl.segments_.emplace_back(Literal{std::move(seg.text), seg.offset});
            continue;
        }
        auto field = parse_field(seg.text, seg.offset, source, opts);
        if (field.is_err()) return std::move(field).error();
        tmpl.segments_.emplace_back(std::move(field).value());
    }

    return Result<Template>::ok(std::move(tmpl));
}

std::vector<const FieldRef*> Template::fields() const {
    std::vector<const FieldRef*> out;
    for (const auto& seg : segments_) {
        if (auto f = std::get_if<FieldRef>(&seg)) out.push_back(f);
    }
    return out;
}

size_t Template::field_count() const {
    size_t n = 0;
    for (const auto& seg : segments_) {
        if (std::holds_alternative<FieldRef>(seg)) ++n;
    }
    return n;
}

std::string Template::normalized() const {
    std::string out;
    for (const auto& seg : segments_) {
        if (auto lit = std::get_if<Literal>(&seg)) {
            out += lit->text;
        } else {
            out += std::get<FieldRef>(seg).raw_span;
        }
    }
    return out;
}

} // namespace pformat
