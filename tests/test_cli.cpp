#include <catch2/catch.hpp>
#include <lox/cli.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace lox;

static std::string fixture(const std::string& name) {
    const char* src = std::getenv("LOX_SOURCE_DIR");
    std::string dir = src ? std::string(src) + "/tests/fixtures" : "../tests/fixtures";
    return dir + "/" + name;
}

// Writes a scratch file that is removed when the test case ends
struct TempFile {
    std::string path;
    TempFile(std::string p, const std::string& contents) : path(std::move(p)) {
        std::ofstream f(path);
        f << contents;
    }
    ~TempFile() { std::remove(path.c_str()); }
};

// ===== Argument parsing =====

TEST_CASE("parse_args reads flags and the script path", "[cli]") {
    auto r = parse_args({"--debug-ast", "-v", "--verbose", "--config", "my.toml", "main.lox"});
    REQUIRE(r.is_ok());
    auto& opts = r.value();
    CHECK(opts.debug_ast);
    CHECK(opts.verbosity == 2);
    REQUIRE(opts.config_path);
    CHECK(*opts.config_path == "my.toml");
    REQUIRE(opts.file);
    CHECK(*opts.file == "main.lox");
    CHECK_FALSE(opts.help);
}

TEST_CASE("no arguments means the prompt", "[cli]") {
    auto r = parse_args({});
    REQUIRE(r.is_ok());
    CHECK_FALSE(r.value().file);
    CHECK_FALSE(r.value().config_path);
}

TEST_CASE("unknown option is a usage error", "[cli]") {
    auto r = parse_args({"--bogus"});
    REQUIRE(r.is_err());
    CHECK(r.error().first().code == LoxError::Usage);
    CHECK(r.error().first().message == "unknown option: --bogus");
    CHECK(exit_code_for(r.error()) == kExitUsage);
}

TEST_CASE("usage errors for malformed command lines", "[cli]") {
    auto missing = parse_args({"--config"});
    REQUIRE(missing.is_err());
    CHECK(exit_code_for(missing.error()) == kExitUsage);

    auto two_files = parse_args({"a.lox", "b.lox"});
    REQUIRE(two_files.is_err());
    CHECK(two_files.error().first().message == "only one script file may be given");
    CHECK(exit_code_for(two_files.error()) == kExitUsage);
}

// ===== Exit codes =====

TEST_CASE("exit code follows the failing phase", "[cli]") {
    auto scan_state = ErrorState::scanner();
    scan_state.add({LoxError::Scan, "s", 1});
    CHECK(exit_code_for(scan_state) == kExitDataErr);

    auto parse_state = ErrorState::parser();
    parse_state.add({LoxError::Parse, "p", 1});
    CHECK(exit_code_for(parse_state) == kExitDataErr);

    CHECK(exit_code_for(ErrorState(LoxError{LoxError::Runtime, "r", 1})) == kExitSoftware);
    CHECK(exit_code_for(ErrorState(LoxError{LoxError::IO, "io"})) == kExitIOErr);
    CHECK(exit_code_for(ErrorState(LoxError{LoxError::Config, "cfg"})) == kExitIOErr);
    CHECK(exit_code_for(ErrorState(LoxError{LoxError::Usage, "u"})) == kExitUsage);
}

// ===== Running files =====

TEST_CASE("run_file succeeds on a clean script", "[cli]") {
    std::ostringstream out, err;
    CHECK(run_file(fixture("arith.lox"), Config{}, out, err) == kExitOk);
    CHECK(out.str() == "42\n6.5\narea: computed\nfalse\nfalse\n");
    CHECK(err.str().empty());
}

TEST_CASE("run_file exits 65 on scan errors", "[cli]") {
    std::ostringstream out, err;
    CHECK(run_file(fixture("scan_error.lox"), Config{}, out, err) == kExitDataErr);
    CHECK(out.str() == "[2]: unexpected character: @\n");
}

TEST_CASE("run_file exits 65 on parse errors", "[cli]") {
    std::ostringstream out, err;
    CHECK(run_file(fixture("parse_errors.lox"), Config{}, out, err) == kExitDataErr);
    CHECK(out.str() ==
          "[1]: expected variable name, got '='\n"
          "[3]: expected expression, got ';'\n");
}

TEST_CASE("run_file exits 70 on a runtime error", "[cli]") {
    std::ostringstream out, err;
    CHECK(run_file(fixture("runtime_error.lox"), Config{}, out, err) == kExitSoftware);
    CHECK(out.str() == "before\n[3]: can only add numbers or strings\n");
}

TEST_CASE("run_file exits 74 when the script is missing", "[cli]") {
    std::ostringstream out, err;
    CHECK(run_file("/nonexistent/script.lox", Config{}, out, err) == kExitIOErr);
    CHECK(out.str().empty());
    CHECK(err.str().find("could not open file: /nonexistent/script.lox") != std::string::npos);
}

// ===== Configuration layering =====

TEST_CASE("missing --config file exits 74", "[cli]") {
    Options opts;
    opts.config_path = "/nonexistent/lox.toml";
    auto r = load_config(opts);
    REQUIRE(r.is_err());
    CHECK(exit_code_for(r.error()) == kExitIOErr);
}

TEST_CASE("invalid --config file exits 74", "[cli]") {
    TempFile file("lox_cli_bad.toml", "[log]\nlevel = \"loud\"\n");
    Options opts;
    opts.config_path = file.path;
    auto r = load_config(opts);
    REQUIRE(r.is_err());
    CHECK(r.error().first().code == LoxError::Config);
    CHECK(exit_code_for(r.error()) == kExitIOErr);
}

TEST_CASE("command-line flags override the config file", "[cli]") {
    TempFile file("lox_cli_layer.toml",
                  "[run]\ndebug-ast = false\n[repl]\nprompt = \"lox> \"\n[log]\nlevel = \"error\"\n");
    auto opts = parse_args({"--config", file.path, "--debug-ast", "-v", "-v"});
    REQUIRE(opts.is_ok());
    auto r = load_config(opts.value());
    REQUIRE(r.is_ok());
    CHECK(r.value().debug_ast);
    CHECK(r.value().log_level == log::Trace);
    CHECK(r.value().prompt == "lox> ");
}

TEST_CASE("config file applies when no flag is given", "[cli]") {
    TempFile file("lox_cli_plain.toml", "[run]\ndebug-ast = true\n[log]\nlevel = \"info\"\n");
    Options opts;
    opts.config_path = file.path;
    auto r = load_config(opts);
    REQUIRE(r.is_ok());
    CHECK(r.value().debug_ast);
    CHECK(r.value().log_level == log::Info);
}
