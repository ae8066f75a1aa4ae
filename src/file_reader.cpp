#define _FILE_OFFSET_BITS 64

#include "itemstream/file_reader.hpp"

#include "itemstream/errors.hpp"
#include "itemstream/signals.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace itemstream {

FileReader::FileReader(const std::string& path) : path_(path) {
    if (path_ == "-") {
        fd_ = STDIN_FILENO;
        return;
    }

    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        const int err = errno;
        throw OpenError("open " + path_ + ": " + std::strerror(err));
    }
    owns_fd_ = true;
}

FileReader::~FileReader() {
    if (owns_fd_ && fd_ >= 0) ::close(fd_);
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        const ssize_t n = ::read(fd_, out.data(), out.size());
        if (n < 0 && errno == EINTR) {
            if (g_cancel.load(std::memory_order_relaxed)) return -1;
            continue;
        }
        return n;
    }
}

} // namespace itemstream
