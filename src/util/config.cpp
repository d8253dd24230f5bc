#include <pformat/config.hpp>
#include <pformat/log.hpp>
#include <toml++/toml.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pformat {

static bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

static PformatError config_error(const std::string& key, const std::string& msg) {
    return PformatError{PformatError::Config, "[pformat] " + key + ": " + msg};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PformatError{PformatError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;
    auto section = doc["pformat"].as_table();
    if (!section) return Result<Config>::ok(std::move(cfg));

    FormatOptions& o = cfg.options;
    for (const auto& [key, val] : *section) {
        std::string k(key);

        if (k == "mode") {
            auto s = val.value<std::string>();
            if (!s) return config_error(k, "expected a string");
            auto m = parse_mode(*s);
            if (m.is_err()) return config_error(k, m.error().message);
            o.mode = m.value();
        } else if (k == "glob-marker") {
            auto s = val.value<std::string>();
            if (!s) return config_error(k, "expected a string");
            o.render.glob_marker = *s;
        } else if (k == "default-marker" || k == "constraint-marker") {
            auto s = val.value<std::string>();
            if (!s || !is_identifier(*s)) return config_error(k, "expected an identifier");
            (k == "default-marker" ? o.syntax.default_marker
                                   : o.syntax.constraint_marker) = *s;
        } else if (k == "default-pattern") {
            auto s = val.value<std::string>();
            if (!s || s->empty()) return config_error(k, "expected a non-empty string");
            o.match.default_pattern = *s;
        } else if (k == "typed-captures") {
            auto b = val.value<bool>();
            if (!b) return config_error(k, "expected a boolean");
            o.match.typed_captures = *b;
        } else if (k == "escape-literals") {
            auto b = val.value<bool>();
            if (!b) return config_error(k, "expected a boolean");
            o.render.escape_literals = *b;
        } else if (k == "cache") {
            auto b = val.value<bool>();
            if (!b) return config_error(k, "expected a boolean");
            o.cache = *b;
        } else if (k == "cache-capacity") {
            auto n = val.value<int64_t>();
            if (!n || *n < 0) return config_error(k, "expected a non-negative integer");
            o.cache_capacity = static_cast<size_t>(*n);
        } else {
            log::warn("ignoring unknown config key [pformat] %s", k.c_str());
            continue;
        }
        cfg.explicit_keys.insert(k);
    }

    // Marker distinctness is checked on the merged layers, not per file
    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PformatError{PformatError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().source = path;
    return cfg;
}

void Config::merge(const Config& other) {
    const FormatOptions& src = other.options;
    for (const auto& k : other.explicit_keys) {
        if (k == "mode")                   options.mode = src.mode;
        else if (k == "glob-marker")       options.render.glob_marker = src.render.glob_marker;
        else if (k == "default-marker")    options.syntax.default_marker = src.syntax.default_marker;
        else if (k == "constraint-marker") options.syntax.constraint_marker = src.syntax.constraint_marker;
        else if (k == "default-pattern")   options.match.default_pattern = src.match.default_pattern;
        else if (k == "typed-captures")    options.match.typed_captures = src.match.typed_captures;
        else if (k == "escape-literals")   options.render.escape_literals = src.render.escape_literals;
        else if (k == "cache")             options.cache = src.cache;
        else if (k == "cache-capacity")    options.cache_capacity = src.cache_capacity;
        explicit_keys.insert(k);
    }
}

Status Config::validate() const {
    const auto& syn = options.syntax;
    if (!is_identifier(syn.default_marker) || !is_identifier(syn.constraint_marker)) {
        return PformatError{PformatError::Config,
            "default and constraint markers must be identifiers"};
    }
    if (syn.default_marker == syn.constraint_marker) {
        return PformatError{PformatError::Config,
            "default-marker and constraint-marker must differ",
            "both are '" + syn.default_marker + "'"};
    }
    return ok_status();
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pformat/config.toml";
}

} // namespace pformat
