#include "itemstream/tar_entry_source.hpp"

#include "itemstream/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

namespace itemstream {

namespace {

std::string ArchiveErr(archive* a) {
    const char* s = a ? archive_error_string(a) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace

void TarEntrySource::ArchiveReadDeleter::operator()(archive* a) const {
    if (a) archive_read_free(a);
}

TarEntrySource::TarEntrySource(std::string path) : path_(std::move(path)) {}

TarEntrySource::TarEntrySource(std::string path, Options opt)
    : path_(std::move(path)), opt_(opt) {}

TarEntrySource::~TarEntrySource() = default;

void TarEntrySource::Open() {
    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) throw OpenError("archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    const char* filename = path_ == "-" ? nullptr : path_.c_str();
    if (archive_read_open_filename(ar.get(), filename, opt_.block_size) != ARCHIVE_OK) {
        throw OpenError("archive_read_open_filename " + path_ + ": " + ArchiveErr(ar.get()));
    }
    ar_ = std::move(ar);
}

std::optional<TarEntry> TarEntrySource::Next() {
    TarEntry entry;
    std::optional<std::uint64_t> size;
    if (!NextFileHeader(entry.path, size)) return std::nullopt;

    if (size && *size > opt_.max_entry_bytes) {
        throw FormatError(path_ + ": entry " + entry.path + " is " + std::to_string(*size) +
                          " bytes, limit is " + std::to_string(opt_.max_entry_bytes));
    }

    if (size) entry.data.reserve(static_cast<size_t>(*size));
    char buf[64 * 1024];
    while (true) {
        const la_ssize_t n = archive_read_data(ar_.get(), buf, sizeof(buf));
        if (n < 0) {
            throw SourceError("archive_read_data " + entry.path + ": " + ArchiveErr(ar_.get()));
        }
        if (n == 0) break;
        if (entry.data.size() + static_cast<size_t>(n) > opt_.max_entry_bytes) {
            throw FormatError(path_ + ": entry " + entry.path + " exceeds " +
                              std::to_string(opt_.max_entry_bytes) + " bytes");
        }
        entry.data.append(buf, static_cast<size_t>(n));
    }

    if (size && entry.data.size() != *size) {
        throw FormatError(path_ + ": entry " + entry.path + " is truncated");
    }
    entry.size = entry.data.size();
    return entry;
}

void TarEntrySource::Close() {
    if (!ar_) return;
    const int rc = archive_read_close(ar_.get());
    std::string err = rc == ARCHIVE_OK ? std::string() : ArchiveErr(ar_.get());
    ar_.reset();
    if (rc != ARCHIVE_OK) throw CloseError("archive_read_close " + path_ + ": " + err);
}

void TarEntrySource::Advance(std::uint64_t n) {
    std::string path;
    std::optional<std::uint64_t> size;
    for (std::uint64_t i = 0; i < n; ++i) {
        if (!NextFileHeader(path, size)) throw ShortInput(i, n);
        if (archive_read_data_skip(ar_.get()) != ARCHIVE_OK) {
            throw SourceError("archive_read_data_skip " + path + ": " + ArchiveErr(ar_.get()));
        }
    }
    LogDebug("%s: skipped %llu entries", path_.c_str(), (unsigned long long)n);
}

bool TarEntrySource::NextFileHeader(std::string& path, std::optional<std::uint64_t>& size) {
    if (!ar_) throw SourceError("TarEntrySource " + path_ + " is not open");

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar_.get(), &entry);
        if (r == ARCHIVE_EOF) return false;
        if (r == ARCHIVE_WARN) {
            LogDebug("%s: %s", path_.c_str(), ArchiveErr(ar_.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            throw FormatError("archive_read_next_header " + path_ + ": " + ArchiveErr(ar_.get()));
        }

        if (archive_entry_filetype(entry) != AE_IFREG) {
            // Bodies of non-file entries are left to libarchive to skip.
            continue;
        }

        const char* p = archive_entry_pathname(entry);
        path = p ? std::string(p) : std::string();
        size.reset();
        if (archive_entry_size_is_set(entry)) {
            size = static_cast<std::uint64_t>(archive_entry_size(entry));
        }
        return true;
    }
}

} // namespace itemstream
