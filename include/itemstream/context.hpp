#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace itemstream {

using ContextValue = std::variant<std::int64_t, double, std::string>;

// Caller-owned key/value state handed to readers at open, checkpoint and
// close time. Persisting it across runs is the caller's job (see
// CheckpointStore).
class CheckpointContext {
public:
    using Map = std::map<std::string, ContextValue, std::less<>>;

    bool ContainsKey(std::string_view key) const;

    void PutLong(const std::string& key, std::int64_t value);
    void PutDouble(const std::string& key, double value);
    void PutString(const std::string& key, std::string value);

    // Throw ContextError when the key is missing or holds another type.
    std::int64_t GetLong(std::string_view key) const;
    double GetDouble(std::string_view key) const;
    const std::string& GetString(std::string_view key) const;

    bool Remove(std::string_view key);

    std::size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }
    const Map& Entries() const { return entries_; }

    bool IsDirty() const { return dirty_; }
    void ClearDirty() { dirty_ = false; }

    // A read-only context rejects every mutation with ContextError.
    void SetReadOnly(bool read_only) { read_only_ = read_only; }
    bool IsReadOnly() const { return read_only_; }

    bool operator==(const CheckpointContext& other) const { return entries_ == other.entries_; }

private:
    void Put(const std::string& key, ContextValue value);
    const ContextValue& Find(std::string_view key) const;

    Map entries_;
    bool dirty_ = false;
    bool read_only_ = false;
};

} // namespace itemstream
