#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <string>
#include <unistd.h>
#include <utility>

namespace rehash {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    return Open(std::move(path), 0, out);
}

Result FileOrStdinReader::Open(std::string path, std::uint64_t offset, FileOrStdinReader& out) {
    out.path_ = std::move(path);
    out.offset_ = offset;
    out.size_ = std::nullopt;

    if (out.path_ == "-") {
        if (offset != 0) {
            return Result::Fail(Errc::IncorrectComputedSize,
                                "standard input cannot be positioned at offset " + std::to_string(offset));
        }
        out.fd_.Reset(STDIN_FILENO);
    } else {
        int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            return Result::Fail(Errc::SourceOpenFailed,
                                "Failed to open input: " + out.path_ + " (" + std::strerror(errno) + ")");
        }
        out.fd_.Reset(fd);
    }

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    }

    if (offset == 0) {
        return Result::Ok();
    }

    if (out.size_ && offset > *out.size_) {
        return Result::Fail(Errc::IncorrectComputedSize,
                            "offset " + std::to_string(offset) + " is beyond the end of " + out.path_ +
                                " (" + std::to_string(*out.size_) + " bytes)");
    }
    if (::lseek(out.fd_.Get(), static_cast<off_t>(offset), SEEK_SET) < 0) {
        return Result::Fail(Errc::IncorrectComputedSize,
                            "cannot seek " + out.path_ + " to " + std::to_string(offset) + " (" +
                                std::strerror(errno) + ")");
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileOrStdinReader::TotalSize() const { return size_; }

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    if (!fd_.Valid()) {
        errno = EBADF;
        return -1;
    }
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

void FileOrStdinReader::Close() { (void)fd_.Close(); }

} // namespace rehash
