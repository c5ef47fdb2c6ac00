#ifndef CHUNKSTREAM_CORE_ERRORS_HPP
#define CHUNKSTREAM_CORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chunkstream {
namespace core {

class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& message)
        : std::runtime_error(message) {}
};

// Bad request input, reported before any byte is written
class ValidationError : public StreamError {
public:
    explicit ValidationError(const std::string& message)
        : StreamError("Validation error: " + message) {}
};

// Range lies outside the resource; carries the size for "Content-Range: bytes */<size>"
class RangeNotSatisfiableError : public ValidationError {
public:
    RangeNotSatisfiableError(const std::string& message, std::uint64_t total_size)
        : ValidationError(message)
        , total_size_(total_size) {}

    std::uint64_t total_size() const { return total_size_; }

private:
    std::uint64_t total_size_;
};

class NotFoundError : public StreamError {
public:
    explicit NotFoundError(const std::string& message)
        : StreamError("Not found: " + message) {}
};

class UnauthorizedError : public StreamError {
public:
    explicit UnauthorizedError(const std::string& message)
        : StreamError("Unauthorized: " + message) {}
};

// Chunk fetch or metadata resolution failed upstream
class UpstreamError : public StreamError {
public:
    explicit UpstreamError(const std::string& message)
        : StreamError("Upstream error: " + message) {}
};

// Fewer bytes produced than promised; always fatal for the stream
class PartialTransferError : public UpstreamError {
public:
    explicit PartialTransferError(const std::string& message)
        : UpstreamError("partial transfer: " + message) {}
};

} // namespace core
} // namespace chunkstream

#endif // CHUNKSTREAM_CORE_ERRORS_HPP
