#pragma once
#include "itemstream/source.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace itemstream {

// In-memory items. Advance() is O(1).
template <typename T>
class ListSource final : public ISource<T> {
public:
    explicit ListSource(std::vector<T> items) : items_(std::move(items)) {}

    void Open() override {
        pos_ = 0;
        open_ = true;
    }

    std::optional<T> Next() override {
        if (!open_) throw SourceError("ListSource is not open");
        if (pos_ >= items_.size()) return std::nullopt;
        return items_[pos_++];
    }

    void Close() override { open_ = false; }

    void Advance(std::uint64_t n) override {
        if (!open_) throw SourceError("ListSource is not open");
        const std::size_t left = items_.size() - pos_;
        if (n > left) {
            pos_ = items_.size();
            throw this->ShortInput(left, n);
        }
        pos_ += static_cast<std::size_t>(n);
    }

    std::size_t Position() const { return pos_; }

private:
    std::vector<T> items_;
    std::size_t pos_ = 0;
    bool open_ = false;
};

} // namespace itemstream
