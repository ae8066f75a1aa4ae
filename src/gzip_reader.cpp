#include "itemstream/gzip_reader.hpp"

#include "itemstream/errors.hpp"

#include <string>

namespace itemstream {

namespace {

constexpr size_t kInBufSize = 64 * 1024;

// 15 window bits, +32 = detect gzip or zlib header.
constexpr int kWindowBits = 15 + 32;

std::string ZErr(const z_stream& zs, int rc) {
    if (zs.msg) return zs.msg;
    return "zlib error " + std::to_string(rc);
}

} // namespace

GzipReader::GzipReader(std::unique_ptr<IReader> inner)
    : inner_(std::move(inner)), in_buf_(kInBufSize) {
    if (!inner_) throw OpenError("GzipReader: null inner reader");

    const int rc = inflateInit2(&zs_, kWindowBits);
    if (rc != Z_OK) throw OpenError("inflateInit2 failed: " + ZErr(zs_, rc));
}

GzipReader::~GzipReader() {
    inflateEnd(&zs_);
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (out.empty()) return 0;

    zs_.next_out = out.data();
    zs_.avail_out = static_cast<uInt>(out.size());

    while (zs_.avail_out == out.size()) {
        if (zs_.avail_in == 0 && !inner_eof_) {
            const ssize_t n = inner_->Read(std::span<std::uint8_t>(in_buf_.data(), in_buf_.size()));
            if (n < 0) return n;
            if (n == 0) {
                inner_eof_ = true;
            } else {
                zs_.next_in = in_buf_.data();
                zs_.avail_in = static_cast<uInt>(n);
            }
        }

        if (stream_end_) {
            if (zs_.avail_in == 0 && inner_eof_) return 0;
            // Another gzip member follows.
            const int rc = inflateReset(&zs_);
            if (rc != Z_OK) throw FormatError("gzip: " + ZErr(zs_, rc));
            stream_end_ = false;
        }

        if (zs_.avail_in == 0 && inner_eof_) {
            throw FormatError("gzip: unexpected end of compressed data");
        }

        const int rc = inflate(&zs_, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            stream_end_ = true;
        } else if (rc == Z_BUF_ERROR) {
            // Needs more input; loop reads it.
            continue;
        } else if (rc != Z_OK) {
            throw FormatError("gzip: " + ZErr(zs_, rc));
        }
    }

    return static_cast<ssize_t>(out.size() - zs_.avail_out);
}

} // namespace itemstream
