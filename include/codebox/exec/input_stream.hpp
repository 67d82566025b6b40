#pragma once

#include "codebox/core/result.hpp"

#include <string>

namespace codebox::exec {

using namespace codebox::core;

// Readable byte stream
class InputStream {
public:
    virtual ~InputStream() = default;

    // Read up to `size` bytes into `buffer`. Returns 0 at end of stream.
    virtual Result<size_t, Error> read(char* buffer, size_t size) = 0;
};

// Owns a file descriptor (usually the read end of a pipe) and closes it
class FdInputStream : public InputStream {
public:
    explicit FdInputStream(int fd);
    ~FdInputStream() override;

    FdInputStream(const FdInputStream&) = delete;
    FdInputStream& operator=(const FdInputStream&) = delete;

    Result<size_t, Error> read(char* buffer, size_t size) override;

    int fd() const { return fd_; }

private:
    int fd_;
};

// In-memory stream. A non-zero chunk size caps every read, which lets tests
// split lines across reads.
class MemoryInputStream : public InputStream {
public:
    explicit MemoryInputStream(std::string data, size_t chunk_size = 0);

    Result<size_t, Error> read(char* buffer, size_t size) override;

private:
    std::string data_;
    size_t offset_ = 0;
    size_t chunk_size_;
};

}  // namespace codebox::exec
