#pragma once

#include "itemstream/context.hpp"
#include "itemstream/context_key.hpp"
#include "itemstream/errors.hpp"
#include "itemstream/logger.hpp"
#include "itemstream/source.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace itemstream {

struct ReaderOptions {
    // Prefix of this reader's context keys. Required when persisting.
    std::string stream_name;
    bool persist_enabled = true;
    // Caps the items handed out per open/close cycle. Not persisted.
    std::optional<std::uint64_t> max_item_count;
};

enum class ReaderState { Unopened, Open, Closed };

// Wraps a source and counts the items read so that a later run can resume
// at the same position. The position is the number of Read() calls since
// Open() (plus the restored count) and is written to the context under
// "<stream_name>.read.count" by Checkpoint().
//
// Not thread-safe: one caller drives Open/Read/Checkpoint/Close in sequence,
// and two live readers must not share a stream name in one context.
template <typename T>
class CheckpointedReader {
public:
    CheckpointedReader(std::unique_ptr<ISource<T>> source, ReaderOptions opt)
        : source_(std::move(source)), opt_(std::move(opt)) {
        if (!source_) throw ConfigError("CheckpointedReader needs a source");
    }

    CheckpointedReader(const CheckpointedReader&) = delete;
    CheckpointedReader& operator=(const CheckpointedReader&) = delete;

    void Open(const CheckpointContext& ctx) {
        if (opt_.persist_enabled && opt_.stream_name.empty()) {
            throw ConfigError("stream_name must be set when persistence is enabled");
        }

        try {
            source_->Open();
        } catch (const std::exception&) {
            std::throw_with_nested(StreamInitError(Tag() + " failed to initialize the reader"));
        }
        items_read_ = 0;
        state_ = ReaderState::Open;

        if (opt_.stream_name.empty()) {
            LogDebug("%s opened, no stream name, not restoring", Tag().c_str());
            return;
        }

        const std::string key = CountKey();
        if (!ctx.ContainsKey(key)) {
            LogDebug("%s opened, no stored position", Tag().c_str());
            return;
        }

        std::uint64_t position = 0;
        try {
            const std::int64_t stored = ctx.GetLong(key);
            if (stored < 0) {
                throw ContextError("Stored count " + std::to_string(stored) + " is negative");
            }
            position = static_cast<std::uint64_t>(stored);
            source_->Advance(position);
        } catch (const std::exception&) {
            AbandonOpen();
            std::throw_with_nested(
                StreamRestoreError(Tag() + " could not move to stored position on restart"));
        }

        items_read_ = position;
        LogInfo("%s resumed at item %llu", Tag().c_str(), (unsigned long long)position);
    }

    // std::nullopt at end of input. Source errors propagate unchanged; the
    // attempt still counts, so a resume after a failed item skips it.
    std::optional<T> Read() {
        if (state_ != ReaderState::Open) {
            throw ReaderStateError(Tag() + " Read() called on a reader that is not open");
        }
        if (opt_.max_item_count && items_read_ >= *opt_.max_item_count) {
            return std::nullopt;
        }

        ++items_read_;
        std::optional<T> item = source_->Next();
        if (!item) {
            // Nothing was consumed; keep the position restorable.
            --items_read_;
        }
        return item;
    }

    void Checkpoint(CheckpointContext& ctx) {
        if (!opt_.persist_enabled) return;

        const std::string key = CountKey();
        try {
            ctx.PutLong(key, static_cast<std::int64_t>(items_read_));
        } catch (const std::exception&) {
            std::throw_with_nested(PersistError(Tag() + " could not store " + key));
        }
        LogDebug("%s checkpoint %s=%llu", Tag().c_str(), key.c_str(),
                 (unsigned long long)items_read_);
    }

    void Close(CheckpointContext& /*ctx*/) {
        items_read_ = 0;
        state_ = ReaderState::Closed;
        try {
            source_->Close();
        } catch (const std::exception&) {
            std::throw_with_nested(StreamCloseError(Tag() + " error while closing item reader"));
        }
        LogDebug("%s closed", Tag().c_str());
    }

    // Hooks for a surrounding rollback mechanism. The only position kept is
    // the item count, so there is nothing to mark or roll back to.
    void Mark() {}
    void Reset() {}

    std::uint64_t ItemsRead() const { return items_read_; }
    ReaderState State() const { return state_; }
    const ReaderOptions& Options() const { return opt_; }

    void SetStreamName(std::string name) { opt_.stream_name = std::move(name); }
    void SetPersistEnabled(bool enabled) { opt_.persist_enabled = enabled; }
    void SetMaxItemCount(std::optional<std::uint64_t> max) { opt_.max_item_count = max; }

private:
    std::string CountKey() const { return FormatContextKey(opt_.stream_name, kReadCountKey); }

    std::string Tag() const {
        return "[" + (opt_.stream_name.empty() ? std::string("unnamed") : opt_.stream_name) + "]";
    }

    // Restore failed after the source was opened: release it again. A close
    // failure here is logged; the restore failure is what gets reported.
    void AbandonOpen() {
        items_read_ = 0;
        state_ = ReaderState::Closed;
        try {
            source_->Close();
        } catch (const std::exception& e) {
            LogError("%s close after failed restore: %s", Tag().c_str(),
                     DescribeError(e).c_str());
        }
    }

    std::unique_ptr<ISource<T>> source_;
    ReaderOptions opt_;
    std::uint64_t items_read_ = 0;
    ReaderState state_ = ReaderState::Unopened;
};

} // namespace itemstream
