#pragma once
#include "itemstream/source.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct archive;

namespace itemstream {

struct TarEntry {
    std::string path;
    std::uint64_t size = 0;
    std::string data;
};

// Regular-file entries of an archive, in archive order. Anything libarchive
// can read (tar, cpio, zip, with gzip/xz/zstd filters) works. Advance()
// skips entry bodies without decoding them.
class TarEntrySource final : public ISource<TarEntry> {
public:
    struct Options {
        // Largest entry body Next() will load into memory.
        std::uint64_t max_entry_bytes = 64ULL * 1024 * 1024;
        std::size_t block_size = 10240;
    };

    explicit TarEntrySource(std::string path);
    TarEntrySource(std::string path, Options opt);
    ~TarEntrySource() override;

    void Open() override;
    std::optional<TarEntry> Next() override;
    void Close() override;
    void Advance(std::uint64_t n) override;

    const std::string& Path() const { return path_; }

private:
    struct ArchiveReadDeleter {
        void operator()(archive* a) const;
    };

    // Moves to the next regular-file header. False at end of archive.
    bool NextFileHeader(std::string& path, std::optional<std::uint64_t>& size);

    std::string path_;
    Options opt_;
    std::unique_ptr<archive, ArchiveReadDeleter> ar_;
};

} // namespace itemstream
