#include "itemstream/context.hpp"

#include "itemstream/errors.hpp"

#include <utility>

namespace itemstream {

namespace {

template <typename T>
const T& As(const ContextValue& v, std::string_view key, const char* type) {
    const T* p = std::get_if<T>(&v);
    if (!p) {
        throw ContextError("Context key '" + std::string(key) + "' does not hold a " + type);
    }
    return *p;
}

} // namespace

bool CheckpointContext::ContainsKey(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

void CheckpointContext::PutLong(const std::string& key, std::int64_t value) {
    Put(key, value);
}

void CheckpointContext::PutDouble(const std::string& key, double value) {
    Put(key, value);
}

void CheckpointContext::PutString(const std::string& key, std::string value) {
    Put(key, std::move(value));
}

std::int64_t CheckpointContext::GetLong(std::string_view key) const {
    return As<std::int64_t>(Find(key), key, "long");
}

double CheckpointContext::GetDouble(std::string_view key) const {
    return As<double>(Find(key), key, "double");
}

const std::string& CheckpointContext::GetString(std::string_view key) const {
    return As<std::string>(Find(key), key, "string");
}

bool CheckpointContext::Remove(std::string_view key) {
    if (read_only_) {
        throw ContextError("Context is read-only, cannot remove '" + std::string(key) + "'");
    }
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    dirty_ = true;
    return true;
}

void CheckpointContext::Put(const std::string& key, ContextValue value) {
    if (read_only_) {
        throw ContextError("Context is read-only, cannot write '" + key + "'");
    }
    entries_[key] = std::move(value);
    dirty_ = true;
}

const ContextValue& CheckpointContext::Find(std::string_view key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw ContextError("Context has no key '" + std::string(key) + "'");
    }
    return it->second;
}

} // namespace itemstream
