#include "itemstream/checkpoint_store.hpp"

#include "itemstream/errors.hpp"
#include "itemstream/logger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>
#include <variant>

namespace itemstream {

namespace {

std::string Errno(int err) {
    return std::strerror(err);
}

nlohmann::json ToJson(const CheckpointContext& ctx) {
    nlohmann::json entries = nlohmann::json::object();
    for (const auto& entry : ctx.Entries()) {
        std::visit([&](const auto& v) { entries[entry.first] = v; }, entry.second);
    }
    return nlohmann::json{{"version", CheckpointStore::kFormatVersion}, {"entries", entries}};
}

void WriteAll(int fd, const std::string& data, const std::string& path) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StoreError("write " + path + ": " + Errno(errno));
        }
        off += static_cast<size_t>(n);
    }
}

} // namespace

CheckpointStore::CheckpointStore(std::string path) : path_(std::move(path)) {}

CheckpointContext CheckpointStore::Load() const {
    CheckpointContext ctx;

    std::ifstream ifs(path_);
    if (!ifs.is_open()) {
        if (::access(path_.c_str(), F_OK) != 0 && errno == ENOENT) {
            LogDebug("CheckpointStore: %s does not exist, starting fresh", path_.c_str());
            return ctx;
        }
        throw StoreError("Cannot open state file " + path_);
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::exception& e) {
        throw StoreError("Corrupt state file " + path_ + ": " + e.what());
    }

    if (!j.is_object() || !j.contains("entries") || !j["entries"].is_object()) {
        throw StoreError("State file " + path_ + " has no 'entries' object");
    }
    if (!j.contains("version") || !j["version"].is_number_integer() ||
        j["version"].get<int>() != kFormatVersion) {
        throw StoreError("State file " + path_ + " has an unsupported version");
    }

    for (auto& [key, v] : j["entries"].items()) {
        if (v.is_number_integer()) {
            ctx.PutLong(key, v.get<std::int64_t>());
        } else if (v.is_number_float()) {
            ctx.PutDouble(key, v.get<double>());
        } else if (v.is_string()) {
            ctx.PutString(key, v.get<std::string>());
        } else {
            throw StoreError("State file " + path_ + ": unsupported value for '" + key + "'");
        }
    }

    ctx.ClearDirty();
    LogDebug("CheckpointStore: loaded %zu entries from %s", ctx.Size(), path_.c_str());
    return ctx;
}

void CheckpointStore::Save(CheckpointContext& ctx) const {
    const std::string data = ToJson(ctx).dump(2) + "\n";
    const std::string tmp_path = path_ + ".tmp";

    const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StoreError("open " + tmp_path + ": " + Errno(errno));
    }

    try {
        WriteAll(fd, data, tmp_path);
        if (::fsync(fd) != 0) throw StoreError("fsync " + tmp_path + ": " + Errno(errno));
    } catch (const StoreError&) {
        ::close(fd);
        ::unlink(tmp_path.c_str());
        throw;
    }

    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        throw StoreError("close " + tmp_path + ": " + Errno(err));
    }

    if (::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        throw StoreError("Atomic rename failed: " + Errno(err));
    }

    ctx.ClearDirty();
    LogDebug("CheckpointStore: saved %zu entries to %s", ctx.Size(), path_.c_str());
}

void CheckpointStore::Clear() const {
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        throw StoreError("unlink " + path_ + ": " + Errno(errno));
    }
}

} // namespace itemstream
