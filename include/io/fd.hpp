#pragma once

namespace rehash {

// Owns a file descriptor. Standard input is never closed.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd);

    // Returns false (errno set) if close(2) failed. The descriptor is
    // released either way.
    bool Close();

  private:
    int fd_{-1};
};

} // namespace rehash
