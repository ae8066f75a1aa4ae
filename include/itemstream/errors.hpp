#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace itemstream {

// Raised by source adapters.

struct OpenError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SourceError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct FormatError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CloseError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct AdvanceError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Raised by CheckpointedReader. Thrown nested: the adapter's exception is
// reachable through std::rethrow_if_nested.

struct StreamError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct StreamInitError : public StreamError {
    using StreamError::StreamError;
};

struct StreamRestoreError : public StreamError {
    using StreamError::StreamError;
};

struct StreamCloseError : public StreamError {
    using StreamError::StreamError;
};

struct PersistError : public StreamError {
    using StreamError::StreamError;
};

struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ContextError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct StoreError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ReaderStateError : public std::logic_error {
    using std::logic_error::logic_error;
};

// "outer: inner: innermost" for a chain built with std::throw_with_nested.
std::string DescribeError(const std::exception& e);

} // namespace itemstream
