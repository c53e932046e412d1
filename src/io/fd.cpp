#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace deployer {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        (void)Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

Result Fd::CreateForWrite(const std::string& path, Fd& out) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(err, "open " + path + ": " + std::strerror(err));
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

Result Fd::Close() {
    if (fd_ < 0)
        return Result::Ok();
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        const int err = errno;
        return Result::Fail(err, std::string("close failed: ") + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace deployer
