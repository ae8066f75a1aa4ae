#pragma once
#include "itemstream/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace itemstream {

// Inflates gzip (or zlib) data read from another reader. Concatenated gzip
// members are decoded back to back. Corrupt input throws FormatError.
class GzipReader final : public IReader {
public:
    explicit GzipReader(std::unique_ptr<IReader> inner);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    std::unique_ptr<IReader> inner_;
    std::vector<std::uint8_t> in_buf_;
    z_stream zs_{};
    bool inner_eof_ = false;
    bool stream_end_ = false;
};

} // namespace itemstream
