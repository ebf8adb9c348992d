#pragma once

#include <lox/lang/value.hpp>
#include <string>
#include <unordered_map>

namespace lox {

// Global variable table. There is a single scope: `var` creates or
// overwrites a binding and bindings live as long as the environment.
class Environment {
public:
    void define(const std::string& name, Value value);

    // nullptr when the name is unbound
    const Value* lookup(const std::string& name) const;

    bool contains(const std::string& name) const { return values_.count(name) != 0; }
    size_t size() const { return values_.size(); }

private:
    std::unordered_map<std::string, Value> values_;
};

} // namespace lox
