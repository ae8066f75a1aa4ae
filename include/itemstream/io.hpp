#pragma once
#include <cstdint>
#include <span>
#include <sys/types.h>

namespace itemstream {

// Byte stream under a line-oriented source.
class IReader {
public:
    virtual ~IReader() = default;

    // Returns number of bytes read into out (0=EOF, <0=error, errno set)
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
};

} // namespace itemstream
