#pragma once

#include "crypto/accumulator.hpp"
#include "engine/cancel_token.hpp"
#include "engine/hash_engine.hpp"
#include "io/io.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/rehash_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

inline std::span<const std::uint8_t> AsBytes(const std::string& s) {
    return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

// Deterministic pseudo-random payload.
inline std::string Payload(size_t n) {
    std::string out(n, '\0');
    std::uint32_t x = 2463534242u;
    for (size_t i = 0; i < n; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        out[i] = static_cast<char>(x & 0xFF);
    }
    return out;
}

inline void WriteFile(const std::string& path, const std::string& data) {
    std::ofstream os(path, std::ios::binary);
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    os.close();
    if (!os.good()) {
        throw std::runtime_error("cannot write " + path);
    }
}

// Serves `data`, at most `max_chunk` bytes per Read().
class MemoryReader : public rehash::IReader {
  public:
    explicit MemoryReader(std::string data, size_t max_chunk = SIZE_MAX)
        : data_(std::move(data)), max_chunk_(max_chunk) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        ++reads_;
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min({out.size(), data_.size() - pos_, max_chunk_});
        std::memcpy(out.data(), data_.data() + pos_, n);
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

    void Close() override {
        if (closed_)
            closed_->store(true);
    }

    // The engine owns (and destroys) the reader, so Close() is observed
    // through a shared flag.
    void TrackClose(std::shared_ptr<std::atomic_bool> flag) { closed_ = std::move(flag); }

  protected:
    std::string data_;
    size_t pos_ = 0;
    size_t max_chunk_;
    size_t reads_ = 0;
    std::shared_ptr<std::atomic_bool> closed_;
};

// Serves `data`, then fails with EIO instead of reporting end of stream.
class FailingReader final : public MemoryReader {
  public:
    FailingReader(std::string data, size_t max_chunk) : MemoryReader(std::move(data), max_chunk) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size()) {
            errno = EIO;
            return -1;
        }
        return MemoryReader::Read(out);
    }
};

// Cancels `token` from inside the n-th Read(). The chunk returned by that
// read is still delivered.
class CancelOnReadReader final : public MemoryReader {
  public:
    CancelOnReadReader(std::string data, size_t max_chunk, size_t cancel_on_read, rehash::CancelToken token)
        : MemoryReader(std::move(data), max_chunk), cancel_on_(cancel_on_read), token_(std::move(token)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = MemoryReader::Read(out);
        if (reads_ == cancel_on_)
            token_.Cancel();
        return n;
    }

  private:
    size_t cancel_on_;
    rehash::CancelToken token_;
};

// Serves `data`, then throws instead of reporting end of stream.
class ThrowingReader final : public MemoryReader {
  public:
    ThrowingReader(std::string data, size_t max_chunk) : MemoryReader(std::move(data), max_chunk) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            throw std::runtime_error("device went away");
        return MemoryReader::Read(out);
    }
};

// Sleeps before every Read().
class SlowReader final : public MemoryReader {
  public:
    SlowReader(std::string data, size_t max_chunk, std::chrono::milliseconds delay)
        : MemoryReader(std::move(data), max_chunk), delay_(delay) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        std::this_thread::sleep_for(delay_);
        return MemoryReader::Read(out);
    }

  private:
    std::chrono::milliseconds delay_;
};

// Counts bytes and refuses to snapshot.
class ByteCountAccumulator final : public rehash::IAccumulator {
  public:
    std::string_view Algorithm() const override { return "COUNT"; }
    std::size_t DigestSize() const override { return 8; }

    void Write(std::span<const std::uint8_t> data) override { count_ += data.size(); }

    rehash::Bytes Sum() const override {
        rehash::Bytes out(8);
        for (int i = 0; i < 8; ++i)
            out[i] = static_cast<std::uint8_t>(count_ >> (56 - 8 * i));
        return out;
    }

    bool SupportsSnapshot() const override { return false; }

    rehash::Result ExportState(rehash::Bytes&) const override {
        return rehash::Result::Fail(rehash::Errc::StateExportUnsupported, "COUNT: state export unsupported");
    }
    rehash::Result ImportState(std::span<const std::uint8_t>) override {
        return rehash::Result::Fail(rehash::Errc::StateExportUnsupported, "COUNT: state import unsupported");
    }

  private:
    std::uint64_t count_ = 0;
};

inline std::vector<rehash::Event> Drain(rehash::EventStream& stream) {
    std::vector<rehash::Event> out;
    while (auto ev = stream.Next()) {
        out.push_back(std::move(*ev));
    }
    return out;
}

} // namespace testutil
