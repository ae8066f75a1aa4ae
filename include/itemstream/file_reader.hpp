#pragma once
#include "itemstream/io.hpp"

#include <string>

namespace itemstream {

// Plain file, or stdin for "-". Throws OpenError if the file cannot be opened.
// Interrupted reads are retried unless g_cancel is set.
class FileReader final : public IReader {
public:
    explicit FileReader(const std::string& path);
    ~FileReader() override;

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    std::string path_;
    int fd_ = -1;
    bool owns_fd_ = false;
};

} // namespace itemstream
