#include <pformat/renderer.hpp>

namespace pformat {

static void append_escaped(std::string& out, const std::string& text) {
    for (char c : text) {
        out.push_back(c);
        if (c == '{' || c == '}') out.push_back(c);
    }
}

Result<std::string> render(const Template& tmpl,
                           Mode mode,
                           const Bindings& bindings,
                           const RenderOptions& opts) {
    std::string out;
    out.reserve(tmpl.source().size());

    for (const auto& seg : tmpl.segments()) {
        if (auto lit = std::get_if<Literal>(&seg)) {
            if (opts.escape_literals) {
                append_escaped(out, lit->text);
            } else {
                out += lit->text;
            }
            continue;
        }

        const auto& field = std::get<FieldRef>(seg);
        auto text = resolve_field(field, mode, bindings, opts.glob_marker);
        if (text.is_err()) {
            PformatError e = std::move(text).error();
            e.source = tmpl.source();
            e.position = static_cast<int>(field.offset);
            e.hint = "while formatting field " + field.raw_span;
            return e;
        }
        out += text.value();
    }

    return Result<std::string>::ok(std::move(out));
}

} // namespace pformat
