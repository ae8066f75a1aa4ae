#pragma once
#include "itemstream/context.hpp"

#include <string>

namespace itemstream {

// Keeps a CheckpointContext in a JSON state file between runs:
//   {"version": 1, "entries": {"<key>": <integer|number|string>, ...}}
class CheckpointStore {
public:
    static constexpr int kFormatVersion = 1;

    explicit CheckpointStore(std::string path);

    // Empty context when the file does not exist. Throws StoreError when it
    // cannot be read or parsed.
    CheckpointContext Load() const;

    // Atomic replace (temp file, fsync, rename). Clears ctx's dirty flag.
    void Save(CheckpointContext& ctx) const;

    // Removes the state file; a missing file is not an error.
    void Clear() const;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

} // namespace itemstream
