// demo_pformat.cpp
//
// A small standalone program that walks a template through the three render
// modes, then parses a formatted string back into field values.  Run it with:
//
//     ./demo_pformat                                   # built-in template
//     ./demo_pformat '{split}/{idx:04d}.png' val/0012.png
//     ./demo_pformat '{a' x                            # parse error
//     ./demo_pformat '{n._re[\d+]}.log' run.log        # pattern mismatch
//
// Options come from ~/.pformat/config.toml and ./pformat.toml when present.
// Set PFORMAT_LOG=debug to see the compiled reverse pattern.

#include <pformat/formatter.hpp>
#include <pformat/log.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace pformat;

// Missing files are fine; broken ones are not.
static Result<std::optional<Config>> load_layer(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    log::info("loading config %s", path.c_str());
    return Config::load(path).map([](const Config& cfg) {
        return std::optional<Config>(cfg);
    });
}

static Result<std::unique_ptr<Formatter>> make_formatter() {
    auto global = load_layer(global_config_path());
    PFORMAT_TRY(global);
    auto local = load_layer("pformat.toml");
    PFORMAT_TRY(local);
    return Formatter::from_config(Config::effective(global.value(), local.value()));
}

static Status run(const Formatter& f, const std::string& tmpl, const std::string& candidate) {
    Bindings bindings{
        {"split", "train"},
        {"exp", Value::object({{"name", "baseline"}, {"tags", Value::list({"small"})}})},
        {"seed", 3},
        {"loss", 0.0625},
    };

    std::cout << "template:  " << tmpl << "\n";
    for (Mode mode : {Mode::Partial, Mode::Glob, Mode::Default}) {
        auto out = f.render(tmpl, mode, bindings);
        PFORMAT_TRY(out);
        std::cout << "  " << mode_name(mode) << ":" << std::string(9 - std::string(mode_name(mode)).size(), ' ')
                  << out.value() << "\n";
    }

    PFORMAT_TRY(f.validate(tmpl, bindings));

    auto captures = f.parse(tmpl, candidate);
    PFORMAT_TRY(captures);
    std::cout << "candidate: " << candidate << "\n";
    for (const auto& [key, text] : captures.value()) {
        std::cout << "  " << key << " = " << text << "\n";
    }

    auto s = f.cache_stats();
    log::info("cache: %zu hits, %zu misses, %zu entries", s.hits, s.misses, s.entries);
    return ok_status();
}

int main(int argc, char** argv) {
    log::set_level(log::Info);
    log::init_from_env();

    std::string tmpl = R"({split}/{exp.name}_{seed._re[\d+]:d}/{idx._[0]:04d}_{loss:.3f}.png)";
    std::string candidate = "val/ablation_7/0012_0.250.png";
    if (argc >= 3) {
        tmpl = argv[1];
        candidate = argv[2];
    } else if (argc == 2) {
        std::cerr << PformatError{PformatError::InvalidArg,
                                  "a template needs a candidate string",
                                  "usage: demo_pformat [<template> <candidate>]"}.format()
                  << "\n";
        return 2;
    }

    auto formatter = make_formatter();
    if (formatter.is_err()) {
        std::cerr << formatter.error().format() << "\n";
        return 1;
    }

    auto status = run(*formatter.value(), tmpl, candidate);
    if (status.is_err()) {
        log::error("demo failed");
        std::cerr << "\n" << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
