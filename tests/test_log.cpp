#include <catch2/catch.hpp>
#include <pformat/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using namespace pformat;

namespace {

// Captures log output into a temp file for the lifetime of the guard
struct LogCapture {
    std::FILE* file;
    log::Level saved_level;

    explicit LogCapture(log::Level lvl) : file(std::tmpfile()), saved_level(log::get_level()) {
        log::set_output(file);
        log::set_color_enabled(false);
        log::set_level(lvl);
    }

    ~LogCapture() {
        log::set_output(nullptr);
        log::set_level(saved_level);
        if (file) std::fclose(file);
    }

    std::string text() {
        std::fflush(file);
        std::rewind(file);
        std::string out;
        char buf[256];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0) out.append(buf, n);
        return out;
    }
};

} // namespace

TEST_CASE("messages carry the level prefix", "[log]") {
    LogCapture cap(log::Info);
    REQUIRE(cap.file != nullptr);
    log::info("parsed %d fields", 3);
    REQUIRE(cap.text() == "pformat info: parsed 3 fields\n");
}

TEST_CASE("messages below the level are dropped", "[log]") {
    LogCapture cap(log::Warn);
    REQUIRE(cap.file != nullptr);
    log::debug("hidden");
    log::trace("hidden");
    log::error("shown %s", "here");
    REQUIRE(cap.text() == "pformat error: shown here\n");
}

TEST_CASE("parse log level names", "[log]") {
    REQUIRE(log::parse_level("trace").value() == log::Trace);
    REQUIRE(log::parse_level("DEBUG").value() == log::Debug);
    REQUIRE(log::parse_level("Warn").value() == log::Warn);

    auto bad = log::parse_level("verbose");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == PformatError::InvalidArg);
}

TEST_CASE("level from environment", "[log]") {
    auto saved = log::get_level();

    setenv("PFORMAT_LOG", "debug", 1);
    REQUIRE(log::init_from_env());
    REQUIRE(log::get_level() == log::Debug);

    {
        LogCapture cap(log::Warn);
        setenv("PFORMAT_LOG", "loud", 1);
        REQUIRE_FALSE(log::init_from_env());
        REQUIRE(log::get_level() == log::Warn);
        REQUIRE(cap.text().find("ignoring PFORMAT_LOG") != std::string::npos);
    }

    unsetenv("PFORMAT_LOG");
    REQUIRE_FALSE(log::init_from_env());
    log::set_level(saved);
}

TEST_CASE("level names", "[log]") {
    REQUIRE(std::string(log::level_name(log::Trace)) == "trace");
    REQUIRE(std::string(log::level_name(log::Error)) == "error");
}

TEST_CASE("concurrent logging keeps every message", "[log]") {
    LogCapture cap(log::Trace);
    REQUIRE(cap.file != nullptr);

    constexpr int kThreads = 4;
    constexpr int kMessages = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < kMessages; ++i) {
                log::trace("thread %d message %d", t, i);
                if (log::get_level() != log::Trace) log::error("level changed");
            }
        });
    }
    log::set_color_enabled(false);
    for (auto& th : threads) th.join();

    std::string text = cap.text();
    size_t lines = 0;
    for (char c : text) lines += (c == '\n');
    REQUIRE(lines == static_cast<size_t>(kThreads * kMessages));
    REQUIRE(text.find("level changed") == std::string::npos);
    REQUIRE(text.find("\033[") == std::string::npos);
}
