#include "itemstream/line_source.hpp"

#include "itemstream/file_reader.hpp"
#include "itemstream/gzip_reader.hpp"
#include "itemstream/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace itemstream {

namespace {

constexpr std::size_t kReadBufSize = 64 * 1024;

bool EndsWithGz(const std::string& s) {
    return s.size() >= 3 && s.compare(s.size() - 3, 3, ".gz") == 0;
}

} // namespace

LineSource::LineSource(std::string path, LineSourceOptions opt)
    : path_(std::move(path)), opt_(opt) {}

void LineSource::Open() {
    std::unique_ptr<IReader> reader = std::make_unique<FileReader>(path_);

    const bool gzip = opt_.compression == Compression::Gzip ||
                      (opt_.compression == Compression::Auto && EndsWithGz(path_));
    if (gzip) {
        LogDebug("Wrapping GzipReader for %s", path_.c_str());
        reader = std::make_unique<GzipReader>(std::move(reader));
    }

    reader_ = std::move(reader);
    buf_.resize(kReadBufSize);
    buf_pos_ = 0;
    buf_len_ = 0;
    eof_ = false;
    line_no_ = 0;
}

std::optional<std::string> LineSource::Next() {
    if (!reader_) throw SourceError("LineSource " + path_ + " is not open");

    std::string line;
    // An overlong line is consumed up to its end before FormatError is
    // thrown, so the next call starts on the following line.
    bool overlong = false;

    while (true) {
        if (buf_pos_ == buf_len_ && !Fill()) break;

        const auto* begin = buf_.data() + buf_pos_;
        const auto* end = buf_.data() + buf_len_;
        const auto* nl = std::find(begin, end, static_cast<std::uint8_t>('\n'));

        const std::size_t take = static_cast<std::size_t>(nl - begin);
        if (!overlong && line.size() + take > opt_.max_line_bytes) {
            overlong = true;
            line.clear();
        }
        if (!overlong) line.append(begin, nl);

        if (nl != end) {
            buf_pos_ += take + 1;
            ++line_no_;
            if (overlong) throw Overlong();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        buf_pos_ = buf_len_;
    }

    if (overlong) {
        ++line_no_;
        throw Overlong();
    }

    // Last line without a trailing newline.
    if (!line.empty()) {
        if (line.back() == '\r') line.pop_back();
        ++line_no_;
        return line;
    }
    return std::nullopt;
}

void LineSource::Advance(std::uint64_t n) {
    if (!reader_) throw SourceError("LineSource " + path_ + " is not open");

    std::uint64_t skipped = 0;
    // Bytes of a line seen without its line break yet.
    bool partial = false;

    while (skipped < n) {
        if (buf_pos_ == buf_len_ && !Fill()) {
            if (partial) {
                ++skipped;
                ++line_no_;
            }
            if (skipped < n) throw ShortInput(skipped, n);
            break;
        }

        const auto* begin = buf_.data() + buf_pos_;
        const auto* end = buf_.data() + buf_len_;
        const auto* nl = std::find(begin, end, static_cast<std::uint8_t>('\n'));
        if (nl == end) {
            partial = true;
            buf_pos_ = buf_len_;
            continue;
        }

        buf_pos_ += static_cast<std::size_t>(nl - begin) + 1;
        partial = false;
        ++skipped;
        ++line_no_;
    }
    LogDebug("%s: skipped %llu lines", path_.c_str(), (unsigned long long)n);
}

FormatError LineSource::Overlong() const {
    return FormatError(path_ + ": line " + std::to_string(line_no_) + " exceeds " +
                       std::to_string(opt_.max_line_bytes) + " bytes");
}

void LineSource::Close() {
    reader_.reset();
    buf_.clear();
    buf_.shrink_to_fit();
    buf_pos_ = 0;
    buf_len_ = 0;
}

bool LineSource::Fill() {
    if (eof_) return false;

    const ssize_t n = reader_->Read(std::span<std::uint8_t>(buf_.data(), buf_.size()));
    if (n < 0) {
        const int err = errno;
        throw SourceError("read " + path_ + ": " + std::strerror(err));
    }
    buf_pos_ = 0;
    buf_len_ = static_cast<std::size_t>(n);
    if (n == 0) {
        eof_ = true;
        return false;
    }
    return true;
}

} // namespace itemstream
