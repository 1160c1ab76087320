#include "io/fd.hpp"

#include <unistd.h>
#include <utility>

namespace rehash {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        (void)Close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

bool Fd::Close() {
    const int fd = std::exchange(fd_, -1);
    if (fd < 0 || fd == STDIN_FILENO) return true;
    return ::close(fd) == 0;
}

} // namespace rehash
