#include <catch2/catch.hpp>
#include <lox/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe(fds) _pipe(fds, 4096, 0)
#else
#include <unistd.h>
#endif

using namespace lox::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
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
    long n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);

    return output;
}

// Restores the default level when a test case ends
struct LevelGuard {
    Level saved = get_level();
    ~LevelGuard() { set_level(saved); }
};

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    LevelGuard guard;
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
}

TEST_CASE("level_name() and parse_level() agree", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        auto parsed = parse_level(level_name(lvl));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == lvl);
    }
    REQUIRE(parse_level("warning") == Warn);
    REQUIRE_FALSE(parse_level("loud").has_value());
    REQUIRE_FALSE(parse_level("").has_value());
}

TEST_CASE("enabled() follows the threshold", "[log]") {
    LevelGuard guard;
    set_level(Info);
    CHECK_FALSE(enabled(Debug));
    CHECK(enabled(Info));
    CHECK(enabled(Error));
    CHECK_FALSE(enabled(Off));

    set_level(Off);
    CHECK_FALSE(enabled(Error));
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    LevelGuard guard;
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    LevelGuard guard;
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output == "warn: this is a warning\nerror: this is an error\n");
}

TEST_CASE("Off silences everything", "[log]") {
    LevelGuard guard;
    set_level(Off);
    auto output = capture_stderr([] {
        error("silent");
    });
    REQUIRE(output.empty());
}

TEST_CASE("Format string substitution", "[log]") {
    LevelGuard guard;
    set_level(Trace);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        trace("scanned %zu tokens on line %d", static_cast<size_t>(12), 3);
    });
    REQUIRE(output == "trace: scanned 12 tokens on line 3\n");
}

TEST_CASE("Color prefix wraps the level name", "[log]") {
    LevelGuard guard;
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        info("hi");
    });
    set_color_enabled(false);
    REQUIRE(output == "\033[32minfo\033[0m: hi\n");
}

TEST_CASE("Each level function writes under its own name", "[log]") {
    LevelGuard guard;
    set_level(Trace);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        trace("t %d", 1);
        debug("d %d", 2);
        info("i %d", 3);
        warn("w %d", 4);
        error("e %d", 5);
    });
    REQUIRE(output == "trace: t 1\ndebug: d 2\ninfo: i 3\nwarn: w 4\nerror: e 5\n");
}
