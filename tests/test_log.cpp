#include <catch2/catch.hpp>
#include <fuid/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace fuid::log;

// Helper: run fn with log output redirected to a temp file, return what it wrote
static std::string capture_log(std::function<void()> fn) {
    FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_output(tmp);

    fn();

    set_output(nullptr);
    std::fflush(tmp);
    std::rewind(tmp);

    std::string output;
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts level names in any case", "[log]") {
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("DEBUG").value() == Debug);
    REQUIRE(parse_level("Warn").value() == Warn);
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    auto r = parse_level("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == fuid::FuidError::Config);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("set_output(nullptr) restores stderr", "[log]") {
    set_output(nullptr);
    REQUIRE(get_output() == stderr);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        info("should not appear");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at and above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output == "warn: this is a warning\nerror: this is an error\n");

    set_level(Info);
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_log([] {
        info("hello");
    });
    REQUIRE(output == "\033[32minfo\033[0m: hello\n");

    set_color_enabled(false);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_log([] {
        info("value: %d, name: %s", 42, "test");
    });
    REQUIRE(output == "info: value: 42, name: test\n");
}
