#pragma once
#include "itemstream/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace itemstream {

// Produces items one at a time from one input. Single cursor, not
// thread-safe.
template <typename T>
class ISource {
public:
    virtual ~ISource() = default;

    // Throws OpenError when resources cannot be acquired.
    virtual void Open() = 0;

    // std::nullopt at end of input. Throws SourceError (I/O) or FormatError
    // (undecodable data).
    virtual std::optional<T> Next() = 0;

    // Throws CloseError. Must tolerate being called without a prior Open().
    virtual void Close() = 0;

    // Skips n items. Override when the input can be positioned without
    // decoding every item; the override must leave the source where n calls
    // to Next() would and fail the same way on short input.
    virtual void Advance(std::uint64_t n) {
        for (std::uint64_t i = 0; i < n; ++i) {
            if (!Next()) throw ShortInput(i, n);
        }
    }

protected:
    static AdvanceError ShortInput(std::uint64_t skipped, std::uint64_t requested) {
        return AdvanceError("Input ended after " + std::to_string(skipped) + " of " +
                            std::to_string(requested) + " items");
    }
};

} // namespace itemstream
