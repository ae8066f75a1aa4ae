#pragma once
#include "itemstream/io.hpp"
#include "itemstream/source.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace itemstream {

enum class Compression { None, Gzip, Auto };

struct LineSourceOptions {
    Compression compression = Compression::Auto; // Auto: gzip iff path ends in ".gz"
    std::size_t max_line_bytes = 1024 * 1024;
};

// One item per text line of a file ("-" = stdin), without the line break.
// Advance() only scans for line breaks: no lines are built and the length
// limit does not apply to skipped lines.
class LineSource final : public ISource<std::string> {
public:
    explicit LineSource(std::string path, LineSourceOptions opt = {});

    void Open() override;
    std::optional<std::string> Next() override;
    void Close() override;
    void Advance(std::uint64_t n) override;

    // Lines returned since Open().
    std::uint64_t LineNumber() const { return line_no_; }
    const std::string& Path() const { return path_; }

private:
    bool Fill();
    FormatError Overlong() const;

    std::string path_;
    LineSourceOptions opt_;
    std::unique_ptr<IReader> reader_;
    std::vector<std::uint8_t> buf_;
    std::size_t buf_pos_ = 0;
    std::size_t buf_len_ = 0;
    bool eof_ = false;
    std::uint64_t line_no_ = 0;
};

} // namespace itemstream
