#include <catch2/catch.hpp>
#include <uidkit/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <unistd.h>

using namespace uidkit::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name and level_from_name agree", "[log]") {
    REQUIRE(std::string(level_name(Warn)) == "warn");
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto parsed = level_from_name(level_name(lvl));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == lvl);
    }
    REQUIRE_FALSE(level_from_name("loud").has_value());
    REQUIRE_FALSE(level_from_name("WARN").has_value());
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] { info("should not appear"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("uidkit warn: this is a warning\n") != std::string::npos);
    REQUIRE(output.find("uidkit error: this is an error\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("generated %d ids from %s", 42, "/dev/urandom");
    });
    REQUIRE(output == "uidkit info: generated 42 ids from /dev/urandom\n");
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] { info("hello"); });
    REQUIRE(output.find("\033[32minfo\033[0m: hello") != std::string::npos);

    set_color_enabled(false);
}
