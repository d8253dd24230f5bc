#pragma once

#include <pformat/cache.hpp>
#include <pformat/config.hpp>
#include <pformat/matcher.hpp>
#include <pformat/renderer.hpp>
#include <memory>
#include <string>

namespace pformat {

// Entry point tying parsing, caching, rendering and reverse matching to one
// set of options. Safe to share between threads.
class Formatter {
public:
    explicit Formatter(FormatOptions opts = {});

    // Build from a layered config; fails if the config does not validate
    static Result<std::unique_ptr<Formatter>> from_config(const Config& cfg);

    const FormatOptions& options() const { return opts_; }

    // Parsed template, through the cache when enabled
    Result<std::shared_ptr<const Template>> parse_template(const std::string& tmpl) const;

    // Render with the configured mode
    Result<std::string> render(const std::string& tmpl, const Bindings& bindings) const;
    Result<std::string> render(const std::string& tmpl, Mode mode,
                               const Bindings& bindings) const;

    // Extract field values from an already formatted string
    Result<Captures> parse(const std::string& tmpl, const std::string& candidate) const;

    // Reusable matcher for many candidates against one template
    Result<ReverseMatcher> compile(const std::string& tmpl) const;

    Status validate(const std::string& tmpl, const Bindings& bindings) const;

    // Zeroed stats when caching is disabled
    CacheStats cache_stats() const;

private:
    FormatOptions opts_;
    std::unique_ptr<TemplateCache> cache_;
};

// Process-wide formatter with default options
Formatter& default_formatter();

Result<std::string> render(const std::string& tmpl, Mode mode, const Bindings& bindings);
Result<Captures> parse(const std::string& tmpl, const std::string& candidate);
Status validate(const std::string& tmpl, const Bindings& bindings);

// Shorthands for the three modes
Result<std::string> pformat(const std::string& tmpl, const Bindings& bindings);
Result<std::string> gformat(const std::string& tmpl, const Bindings& bindings);
Result<std::string> dformat(const std::string& tmpl, const Bindings& bindings);

} // namespace pformat
