#include <lox/lang/environment.hpp>

namespace lox {

void Environment::define(const std::string& name, Value value) {
    values_[name] = std::move(value);
}

const Value* Environment::lookup(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return nullptr;
    return &it->second;
}

} // namespace lox
