#pragma once

#include <string>
#include <vector>

namespace lox {

struct LoxError {
    enum Code {
        Scan,
        Parse,
        Runtime,
        IO,
        Config,
        Usage
    };

    Code code = Runtime;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    LoxError() = default;
    LoxError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    LoxError(Code c, std::string msg, int l)
        : code(c), message(std::move(msg)), line(l) {}
    LoxError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    LoxError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // True for errors raised while scanning, parsing or evaluating source
    bool is_diagnostic() const { return code == Scan || code == Parse || code == Runtime; }

    // "[line]: message" for diagnostics, "error[Code]: message" otherwise
    std::string format() const;
    static const char* code_name(Code c);
};

// Error container threaded through the pipeline.
// Scan and Parse states accumulate every error in production order.
// Runtime and Host states hold at most one error.
class ErrorState {
public:
    enum Phase { Scan, Parse, Runtime, Host };

    ErrorState() = default;
    ErrorState(LoxError err);

    static ErrorState scanner() { return ErrorState(Scan); }
    static ErrorState parser() { return ErrorState(Parse); }

    // Returns false when the state is single-slot and already occupied
    bool add(LoxError err);

    Phase phase() const { return phase_; }
    bool empty() const { return errors_.empty(); }
    size_t size() const { return errors_.size(); }
    const std::vector<LoxError>& errors() const { return errors_; }
    const LoxError& first() const { return errors_.front(); }

    std::string format() const;
    static const char* phase_name(Phase p);

private:
    explicit ErrorState(Phase p) : phase_(p) {}

    Phase phase_ = Host;
    std::vector<LoxError> errors_;
};

} // namespace lox
