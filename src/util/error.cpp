#include <lox/error.hpp>

namespace lox {

const char* LoxError::code_name(Code c) {
    switch (c) {
        case Scan:    return "Scan";
        case Parse:   return "Parse";
        case Runtime: return "Runtime";
        case IO:      return "IO";
        case Config:  return "Config";
        case Usage:   return "Usage";
    }
    return "Unknown";
}

std::string LoxError::format() const {
    if (is_diagnostic()) {
        return "[" + std::to_string(line) + "]: " + message;
    }

    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

static ErrorState::Phase phase_for(LoxError::Code c) {
    switch (c) {
        case LoxError::Scan:    return ErrorState::Scan;
        case LoxError::Parse:   return ErrorState::Parse;
        case LoxError::Runtime: return ErrorState::Runtime;
        default:                return ErrorState::Host;
    }
}

ErrorState::ErrorState(LoxError err) : phase_(phase_for(err.code)) {
    errors_.push_back(std::move(err));
}

bool ErrorState::add(LoxError err) {
    if ((phase_ == Runtime || phase_ == Host) && !errors_.empty()) {
        return false;
    }
    errors_.push_back(std::move(err));
    return true;
}

const char* ErrorState::phase_name(Phase p) {
    switch (p) {
        case Scan:    return "scan";
        case Parse:   return "parse";
        case Runtime: return "runtime";
        case Host:    return "host";
    }
    return "unknown";
}

std::string ErrorState::format() const {
    std::string out;
    for (size_t i = 0; i < errors_.size(); ++i) {
        if (i > 0) out += "\n";
        out += errors_[i].format();
    }
    return out;
}

} // namespace lox
