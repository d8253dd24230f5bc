#include <catch2/catch.hpp>
#include <pformat/formatter.hpp>

using namespace pformat;

// ===== Shorthands and free functions =====

TEST_CASE("mode shorthands", "[formatter]") {
    Bindings b{{"param1", "lr0.1"}};
    const std::string tmpl = "{param1}_{param2}/{id}.csv";

    auto p = pformat::pformat(tmpl, b);
    REQUIRE(p.is_ok());
    REQUIRE(p.value() == "lr0.1_{param2}/{id}.csv");

    auto g = pformat::gformat(tmpl, b);
    REQUIRE(g.is_ok());
    REQUIRE(g.value() == "lr0.1_*/*.csv");

    auto d = pformat::dformat(tmpl, b);
    REQUIRE(d.is_ok());
    REQUIRE(d.value() == "lr0.1_{param2}/{id}.csv");
}

TEST_CASE("free render and parse", "[formatter]") {
    auto r = pformat::render("{run}/{step:04d}", Mode::Default, {{"run", "a"}, {"step", 7}});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "a/0007");

    auto c = pformat::parse("{run}/{step:04d}", "a/0007");
    REQUIRE(c.is_ok());
    REQUIRE(c.value().at("run") == "a");
    REQUIRE(c.value().at("step") == "0007");
}

TEST_CASE("free validate", "[formatter]") {
    REQUIRE(pformat::validate(R"({n._re[\d+]})", {{"n", 3}}).is_ok());
    auto r = pformat::validate(R"({n._re[\d+]})", {{"n", -3}});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PformatError::ConstraintViolation);
}

TEST_CASE("parse errors surface from every entry point", "[formatter]") {
    Formatter f;
    REQUIRE(f.render("{a", {}).error().code == PformatError::UnbalancedBrace);
    REQUIRE(f.parse("{a", "x").error().code == PformatError::UnbalancedBrace);
    REQUIRE(f.validate("{a", {}).error().code == PformatError::UnbalancedBrace);
    REQUIRE(f.compile("a}").error().code == PformatError::UnbalancedBrace);
}

TEST_CASE("render and parse agree", "[formatter]") {
    Formatter f;
    const std::string tmpl = R"(exp_{name}_{seed._re[\d+]:d}.ckpt)";
    auto out = f.render(tmpl, Mode::Default, {{"name", "base"}, {"seed", 42}});
    REQUIRE(out.is_ok());
    REQUIRE(out.value() == "exp_base_42.ckpt");

    auto back = f.parse(tmpl, out.value());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().at("name") == "base");
    REQUIRE(back.value().at("seed") == "42");
}

// ===== Options =====

TEST_CASE("configured mode is the default for render", "[formatter]") {
    FormatOptions opts;
    opts.mode = Mode::Glob;
    opts.render.glob_marker = "?";
    Formatter f(opts);

    auto r = f.render("{a}-{b}", {{"a", 1}});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "1-?");

    auto partial = f.render("{a}-{b}", Mode::Partial, {{"a", 1}});
    REQUIRE(partial.value() == "1-{b}");
}

TEST_CASE("custom markers flow through parsing", "[formatter]") {
    FormatOptions opts;
    opts.syntax.default_marker = "or";
    opts.syntax.constraint_marker = "like";
    Formatter f(opts);

    auto r = f.render("{x.or[none]}", Mode::Default, {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "none");

    auto c = f.parse(R"(v{x.like[\d+]})", "v12");
    REQUIRE(c.is_ok());
    REQUIRE(c.value().at("x") == "12");
}

TEST_CASE("escape_literals applies to partial output", "[formatter]") {
    FormatOptions opts;
    opts.render.escape_literals = true;
    Formatter f(opts);

    auto r = f.render("{{{a}}}-{b}", Mode::Partial, {{"a", 1}});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "{{1}}-{b}");
}

TEST_CASE("from_config builds a formatter", "[formatter]") {
    auto cfg = Config::parse("[pformat]\nmode = \"default\"\ncache-capacity = 1\n");
    REQUIRE(cfg.is_ok());
    auto f = Formatter::from_config(cfg.value());
    REQUIRE(f.is_ok());
    REQUIRE(f.value()->options().mode == Mode::Default);
    REQUIRE(f.value()->options().cache_capacity == 1);

    Config bad;
    bad.options.syntax.constraint_marker = "_";
    auto rejected = Formatter::from_config(bad);
    REQUIRE(rejected.is_err());
    REQUIRE(rejected.error().code == PformatError::Config);
}

// ===== Caching =====

TEST_CASE("templates are cached across calls", "[formatter]") {
    Formatter f;
    REQUIRE(f.render("{a}", Mode::Partial, {}).is_ok());
    REQUIRE(f.render("{a}", Mode::Glob, {}).is_ok());
    REQUIRE(f.parse("{a}", "x").is_ok());

    auto s = f.cache_stats();
    REQUIRE(s.entries == 1);
    REQUIRE(s.misses == 1);
    REQUIRE(s.hits == 2);
}

TEST_CASE("caching can be disabled", "[formatter]") {
    FormatOptions opts;
    opts.cache = false;
    Formatter f(opts);
    REQUIRE(f.render("{a}", Mode::Default, {{"a", 1}}).value() == "1");
    REQUIRE(f.render("{a}", Mode::Default, {{"a", 2}}).value() == "2");

    auto s = f.cache_stats();
    REQUIRE(s.entries == 0);
    REQUIRE(s.hits == 0);
}

TEST_CASE("compiled matcher from a formatter", "[formatter]") {
    Formatter f;
    auto m = f.compile("{split}/{idx:d}.png");
    REQUIRE(m.is_ok());
    REQUIRE(m.value().match("train/3.png").value().at("idx") == "3");
    REQUIRE(m.value().match("val/12.png").value().at("split") == "val");
    REQUIRE(m.value().match("val/x.png").is_err());
}
