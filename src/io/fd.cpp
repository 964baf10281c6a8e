#include "io/fd.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace corpus {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

Fd Fd::Open(const std::string& path, int flags, int mode) {
    return Fd(::open(path.c_str(), flags | O_CLOEXEC, mode));
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

Result Fd::Sync() const {
    if (::fsync(fd_) != 0) {
        return Result::FromErrno("fsync");
    }
    return Result::Ok();
}

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

} // namespace corpus
