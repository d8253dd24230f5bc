#pragma once

#include <pformat/matcher.hpp>
#include <pformat/renderer.hpp>
#include <pformat/result.hpp>
#include <optional>
#include <string>
#include <unordered_set>

namespace pformat {

struct FormatOptions {
    Mode mode = Mode::Partial;
    SyntaxOptions syntax;
    RenderOptions render;
    MatchOptions match;
    bool cache = true;
    size_t cache_capacity = 0;
};

// Layered configuration: global (~/.pformat/config.toml) < local.
// Only keys a layer sets explicitly override the layer below.
//
//   [pformat]
//   mode = "glob"
//   glob-marker = "*"
//   default-marker = "_"
//   constraint-marker = "_re"
//   default-pattern = ".+?"
//   typed-captures = true
//   escape-literals = false
//   cache = true
//   cache-capacity = 256
struct Config {
    FormatOptions options;
    std::unordered_set<std::string> explicit_keys;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit keys override this)
    void merge(const Config& other);

    // Markers must be distinct identifiers. parse() checks each key on its
    // own; distinctness only holds for the effective (merged) config.
    Status validate() const;

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// Discover the global config file path: ~/.pformat/config.toml
std::string global_config_path();

} // namespace pformat
