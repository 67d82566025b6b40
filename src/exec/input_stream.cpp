#include "codebox/exec/input_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace codebox::exec {

FdInputStream::FdInputStream(int fd) : fd_(fd) {}

FdInputStream::~FdInputStream() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Result<size_t, Error> FdInputStream::read(char* buffer, size_t size) {
    while (true) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return Result<size_t, Error>::ok(static_cast<size_t>(n));
        }
        if (errno == EINTR) {
            continue;
        }
        return Result<size_t, Error>::err(
            ErrorCode::StreamReadFailed,
            std::strerror(errno),
            "fd " + std::to_string(fd_)
        );
    }
}

MemoryInputStream::MemoryInputStream(std::string data, size_t chunk_size)
    : data_(std::move(data))
    , chunk_size_(chunk_size)
{
}

Result<size_t, Error> MemoryInputStream::read(char* buffer, size_t size) {
    size_t available = data_.size() - offset_;
    size_t n = std::min(size, available);
    if (chunk_size_ > 0) {
        n = std::min(n, chunk_size_);
    }
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return Result<size_t, Error>::ok(n);
}

}  // namespace codebox::exec
