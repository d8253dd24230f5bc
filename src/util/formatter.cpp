#include <pformat/formatter.hpp>

namespace pformat {

Formatter::Formatter(FormatOptions opts)
    : opts_(std::move(opts)) {
    if (opts_.cache) {
        cache_ = std::make_unique<TemplateCache>(opts_.syntax, opts_.cache_capacity);
    }
}

Result<std::unique_ptr<Formatter>> Formatter::from_config(const Config& cfg) {
    PFORMAT_TRY(cfg.validate());
    return Result<std::unique_ptr<Formatter>>::ok(
        std::make_unique<Formatter>(cfg.options));
}

Result<std::shared_ptr<const Template>> Formatter::parse_template(const std::string& tmpl) const {
    if (cache_) return cache_->get_or_parse(tmpl);

    return Template::parse(tmpl, opts_.syntax).and_then([](Template&& t) {
        return Result<std::shared_ptr<const Template>>::ok(
            std::make_shared<const Template>(std::move(t)));
    });
}

Result<std::string> Formatter::render(const std::string& tmpl, const Bindings& bindings) const {
    return render(tmpl, opts_.mode, bindings);
}

Result<std::string> Formatter::render(const std::string& tmpl, Mode mode,
                                      const Bindings& bindings) const {
    return parse_template(tmpl).and_then([&](const std::shared_ptr<const Template>& t) {
        return pformat::render(*t, mode, bindings, opts_.render);
    });
}

Result<ReverseMatcher> Formatter::compile(const std::string& tmpl) const {
    return parse_template(tmpl).and_then([&](const std::shared_ptr<const Template>& t) {
        return ReverseMatcher::compile(*t, opts_.match);
    });
}

Result<Captures> Formatter::parse(const std::string& tmpl, const std::string& candidate) const {
    return compile(tmpl).and_then([&](const ReverseMatcher& m) {
        return m.match(candidate);
    });
}

Status Formatter::validate(const std::string& tmpl, const Bindings& bindings) const {
    return parse_template(tmpl).and_then([&](const std::shared_ptr<const Template>& t) {
        return pformat::validate(*t, bindings);
    });
}

CacheStats Formatter::cache_stats() const {
    return cache_ ? cache_->stats() : CacheStats{};
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

Formatter& default_formatter() {
    static Formatter instance;
    return instance;
}

Result<std::string> render(const std::string& tmpl, Mode mode, const Bindings& bindings) {
    return default_formatter().render(tmpl, mode, bindings);
}

Result<Captures> parse(const std::string& tmpl, const std::string& candidate) {
    return default_formatter().parse(tmpl, candidate);
}

Status validate(const std::string& tmpl, const Bindings& bindings) {
    return default_formatter().validate(tmpl, bindings);
}

Result<std::string> pformat(const std::string& tmpl, const Bindings& bindings) {
    return render(tmpl, Mode::Partial, bindings);
}

Result<std::string> gformat(const std::string& tmpl, const Bindings& bindings) {
    return render(tmpl, Mode::Glob, bindings);
}

Result<std::string> dformat(const std::string& tmpl, const Bindings& bindings) {
    return render(tmpl, Mode::Default, bindings);
}

} // namespace pformat
