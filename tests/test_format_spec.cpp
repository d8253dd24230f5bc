#include <catch2/catch.hpp>
#include <pformat/format_spec.hpp>

using namespace pformat;

static std::string fmt_ok(const Value& v, const std::string& spec) {
    auto r = apply_format_spec(v, spec);
    if (r.is_err()) FAIL(r.error().format());
    return r.value();
}

// ===== Presentation types =====

TEST_CASE("spec_type finds the trailing presentation type", "[format_spec]") {
    REQUIRE(spec_type(".2f") == 'f');
    REQUIRE(spec_type("x") == 'x');
    REQUIRE(spec_type("08.3%") == '%');
    REQUIRE_FALSE(spec_type(">10").has_value());
    REQUIRE_FALSE(spec_type("").has_value());
}

TEST_CASE("type classification", "[format_spec]") {
    REQUIRE(is_integer_type('d'));
    REQUIRE(is_integer_type('X'));
    REQUIRE(is_float_type('e'));
    REQUIRE(is_float_type('%'));
    REQUIRE(is_numeric_type('g'));
    REQUIRE_FALSE(is_numeric_type('s'));
}

// ===== Bound values =====

TEST_CASE("empty spec is str()", "[format_spec]") {
    REQUIRE(fmt_ok(Value(3.0), "") == "3.0");
    REQUIRE(fmt_ok(Value::null(), "") == "None");
    REQUIRE(fmt_ok(Value::list({1, 2}), "") == "[1, 2]");
}

TEST_CASE("float precision", "[format_spec]") {
    REQUIRE(fmt_ok(Value(3.14159), ".2f") == "3.14");
    REQUIRE(fmt_ok(Value(1.23456), ".3e") == "1.235e+00");
}

TEST_CASE("integers widen for float presentation", "[format_spec]") {
    REQUIRE(fmt_ok(Value(3), ".2f") == "3.00");
}

TEST_CASE("integer presentations", "[format_spec]") {
    REQUIRE(fmt_ok(Value(255), "x") == "ff");
    REQUIRE(fmt_ok(Value(255), "#x") == "0xff");
    REQUIRE(fmt_ok(Value(5), "b") == "101");
    REQUIRE(fmt_ok(Value(42), "05d") == "00042");
    REQUIRE(fmt_ok(Value(42), ">5") == "   42");
    REQUIRE(fmt_ok(Value(12345), "n") == "12345");
}

TEST_CASE("percent presentation", "[format_spec]") {
    REQUIRE(fmt_ok(Value(0.25), ".1%") == "25.0%");
    REQUIRE(fmt_ok(Value(1), ".0%") == "100%");
}

TEST_CASE("percent pads the number and sign together", "[format_spec]") {
    REQUIRE(fmt_ok(Value(0.25), ">8.1%") == "   25.0%");
    REQUIRE(fmt_ok(Value(0.25), "<8.1%") == "25.0%   ");
    REQUIRE(fmt_ok(Value(0.25), "8.1%") == "   25.0%");
    REQUIRE(fmt_ok(Value(0.25), "08.1%") == "00025.0%");
    REQUIRE(fmt_ok(Value(-0.25), "=+9.1%") == "-   25.0%");
    REQUIRE(fmt_ok(Value(0.5), "%") == "50.000000%");
}

TEST_CASE("float without type keeps its repr", "[format_spec]") {
    REQUIRE(fmt_ok(Value(3.0), ">6") == "   3.0");
    REQUIRE(fmt_ok(Value(0.5), "<5") == "0.5  ");
}

TEST_CASE("float without type aligns like a number", "[format_spec]") {
    REQUIRE(fmt_ok(Value(1.5), "6") == "   1.5");
    REQUIRE(fmt_ok(Value(3.0), "06") == "0003.0");
    REQUIRE(fmt_ok(Value(-3.0), "07") == "-0003.0");
    REQUIRE(fmt_ok(Value(1.5), "+") == "+1.5");
    REQUIRE(fmt_ok(Value(1.5), "*^7") == "**1.5**");
    REQUIRE(fmt_ok(Value(2.0), "x<5") == "2.0xx");
}

TEST_CASE("string alignment and truncation", "[format_spec]") {
    REQUIRE(fmt_ok(Value("ab"), ">4") == "  ab");
    REQUIRE(fmt_ok(Value("ab"), "<4") == "ab  ");
    REQUIRE(fmt_ok(Value("ab"), "^6") == "  ab  ");
    REQUIRE(fmt_ok(Value("ab"), "*^6") == "**ab**");
    REQUIRE(fmt_ok(Value("abcdef"), ".3") == "abc");
}

TEST_CASE("bools format as text or as 0/1", "[format_spec]") {
    REQUIRE(fmt_ok(Value(true), "") == "True");
    REQUIRE(fmt_ok(Value(true), "5") == "    1");
    REQUIRE(fmt_ok(Value(false), "<3") == "0  ");
    REQUIRE(fmt_ok(Value(true), "d") == "1");
    REQUIRE(fmt_ok(Value(false), ".1f") == "0.0");
}

TEST_CASE("incompatible specs are BadFormatSpec", "[format_spec]") {
    auto a = apply_format_spec(Value("abc"), ".2f");
    REQUIRE(a.is_err());
    REQUIRE(a.error().code == PformatError::BadFormatSpec);

    REQUIRE(apply_format_spec(Value(1.5), "d").is_err());
    REQUIRE(apply_format_spec(Value::null(), ">3").is_err());
    REQUIRE(apply_format_spec(Value::list({1}), "s").is_err());
}

// ===== Conversions =====

TEST_CASE("conversions produce strings", "[format_spec]") {
    auto r = apply_conversion(Value("x"), 'r');
    REQUIRE(r.kind() == Value::String);
    REQUIRE(r.as_string() == "'x'");
    REQUIRE(fmt_ok(r, ">5") == "  'x'");

    REQUIRE(apply_conversion(Value(2), 's').as_string() == "2");
    REQUIRE(apply_conversion(Value("\xc3\xa9"), 'a').as_string() == "'\\xc3\\xa9'");
}

// ===== Inline defaults =====

TEST_CASE("numeric default literal takes the spec", "[format_spec]") {
    REQUIRE(format_default_literal("3", ".2f") == "3.00");
    REQUIRE(format_default_literal("1.5", ".1f") == "1.5");
    REQUIRE(format_default_literal("7", "03d") == "007");
    REQUIRE(format_default_literal("0.5", ".0%") == "50%");
}

TEST_CASE("incompatible default literal is inserted raw", "[format_spec]") {
    REQUIRE(format_default_literal("~unknown~", ".2f") == "~unknown~");
    REQUIRE(format_default_literal("None", ".2f") == "None");
    REQUIRE(format_default_literal("---", ".2f") == "---");
    REQUIRE(format_default_literal("2.5", "d") == "2.5");
}

TEST_CASE("default literal without numeric type is text", "[format_spec]") {
    REQUIRE(format_default_literal("ab", ">4") == "  ab");
    REQUIRE(format_default_literal("--", "") == "--");
    REQUIRE(format_default_literal("x", "+") == "x");
}
