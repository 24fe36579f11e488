#include "persist/file_sink.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace persist {

PosixFileSink::~PosixFileSink() { close(); }

IoResult PosixFileSink::open(const std::string& path) noexcept {
    close();
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {false, errno};
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return {false, err};
    }
    fd_ = fd;
    size_bytes_ = static_cast<std::uint64_t>(st.st_size);
    return {true, 0};
}

void PosixFileSink::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_bytes_ = 0;
}

IoResult PosixFileSink::writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept {
    bytes_written = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    const ssize_t ret = ::writev(fd_, iov, iovcnt);
    if (ret < 0) {
        return {false, errno};
    }
    bytes_written = static_cast<std::size_t>(ret);
    size_bytes_ += static_cast<std::uint64_t>(ret);
    return {true, 0};
}

IoResult PosixFileSink::sync() noexcept {
    if (fd_ < 0) {
        return {false, EBADF};
    }
    if (::fdatasync(fd_) != 0) {
        return {false, errno};
    }
    return {true, 0};
}

IoResult PosixFileSink::truncate(std::uint64_t size) noexcept {
    if (fd_ < 0) {
        return {false, EBADF};
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return {false, errno};
    }
    size_bytes_ = size;
    return {true, 0};
}

} // namespace persist
