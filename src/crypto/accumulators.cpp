// The EVP interface keeps its contexts opaque, so snapshotting needs the
// plain MD5/SHA contexts, which OpenSSL 3 marks deprecated.
#define OPENSSL_SUPPRESS_DEPRECATED

#include "crypto/accumulators.hpp"

#include <openssl/md5.h>
#include <openssl/sha.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace rehash {

namespace {

void AppendU32(Bytes& b, std::uint32_t v) {
    b.push_back(static_cast<std::uint8_t>(v >> 24));
    b.push_back(static_cast<std::uint8_t>(v >> 16));
    b.push_back(static_cast<std::uint8_t>(v >> 8));
    b.push_back(static_cast<std::uint8_t>(v));
}

void AppendU64(Bytes& b, std::uint64_t v) {
    AppendU32(b, static_cast<std::uint32_t>(v >> 32));
    AppendU32(b, static_cast<std::uint32_t>(v));
}

std::uint32_t ReadU32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::uint64_t ReadU64(const std::uint8_t* p) {
    return (static_cast<std::uint64_t>(ReadU32(p)) << 32) | ReadU32(p + 4);
}

template <typename Word>
void AppendWord(Bytes& b, Word w) {
    if constexpr (sizeof(Word) == 8) {
        AppendU64(b, w);
    } else {
        AppendU32(b, w);
    }
}

template <typename Word>
Word ReadWord(const std::uint8_t* p) {
    if constexpr (sizeof(Word) == 8) {
        return ReadU64(p);
    } else {
        return ReadU32(p);
    }
}

struct Md5Traits {
    using Ctx = MD5_CTX;
    using Word = std::uint32_t;
    static constexpr std::string_view kName = "MD5";
    static constexpr std::string_view kMagic{"md5\x01", 4};
    static constexpr std::size_t kWords = 4;
    static constexpr std::size_t kBlock = MD5_CBLOCK;
    static constexpr std::size_t kDigest = MD5_DIGEST_LENGTH;

    static void Init(Ctx& c) { MD5_Init(&c); }
    static void Update(Ctx& c, const void* p, std::size_t n) { MD5_Update(&c, p, n); }
    static void Final(Ctx& c, unsigned char* out) { MD5_Final(out, &c); }

    static void GetWords(const Ctx& c, Word* w) {
        w[0] = c.A;
        w[1] = c.B;
        w[2] = c.C;
        w[3] = c.D;
    }
    static void SetWords(Ctx& c, const Word* w) {
        c.A = w[0];
        c.B = w[1];
        c.C = w[2];
        c.D = w[3];
    }

    // Nl/Nh count bits.
    static std::uint64_t Length(const Ctx& c) {
        return ((static_cast<std::uint64_t>(c.Nh) << 32) | c.Nl) >> 3;
    }
    static void SetLength(Ctx& c, std::uint64_t len) {
        const std::uint64_t bits = len << 3;
        c.Nl = static_cast<MD5_LONG>(bits);
        c.Nh = static_cast<MD5_LONG>(bits >> 32);
        c.num = static_cast<unsigned int>(len % kBlock);
    }

    static const unsigned char* Block(const Ctx& c) { return reinterpret_cast<const unsigned char*>(c.data); }
    static unsigned char* Block(Ctx& c) { return reinterpret_cast<unsigned char*>(c.data); }
    static std::size_t Buffered(const Ctx& c) { return c.num; }
};

struct Sha1Traits {
    using Ctx = SHA_CTX;
    using Word = std::uint32_t;
    static constexpr std::string_view kName = "SHA-1";
    static constexpr std::string_view kMagic{"sha\x01", 4};
    static constexpr std::size_t kWords = 5;
    static constexpr std::size_t kBlock = SHA_CBLOCK;
    static constexpr std::size_t kDigest = SHA_DIGEST_LENGTH;

    static void Init(Ctx& c) { SHA1_Init(&c); }
    static void Update(Ctx& c, const void* p, std::size_t n) { SHA1_Update(&c, p, n); }
    static void Final(Ctx& c, unsigned char* out) { SHA1_Final(out, &c); }

    static void GetWords(const Ctx& c, Word* w) {
        w[0] = c.h0;
        w[1] = c.h1;
        w[2] = c.h2;
        w[3] = c.h3;
        w[4] = c.h4;
    }
    static void SetWords(Ctx& c, const Word* w) {
        c.h0 = w[0];
        c.h1 = w[1];
        c.h2 = w[2];
        c.h3 = w[3];
        c.h4 = w[4];
    }

    static std::uint64_t Length(const Ctx& c) {
        return ((static_cast<std::uint64_t>(c.Nh) << 32) | c.Nl) >> 3;
    }
    static void SetLength(Ctx& c, std::uint64_t len) {
        const std::uint64_t bits = len << 3;
        c.Nl = static_cast<SHA_LONG>(bits);
        c.Nh = static_cast<SHA_LONG>(bits >> 32);
        c.num = static_cast<unsigned int>(len % kBlock);
    }

    static const unsigned char* Block(const Ctx& c) { return reinterpret_cast<const unsigned char*>(c.data); }
    static unsigned char* Block(Ctx& c) { return reinterpret_cast<unsigned char*>(c.data); }
    static std::size_t Buffered(const Ctx& c) { return c.num; }
};

struct Sha256Traits {
    using Ctx = SHA256_CTX;
    using Word = std::uint32_t;
    static constexpr std::string_view kName = "SHA-256";
    static constexpr std::string_view kMagic{"sha\x03", 4};
    static constexpr std::size_t kWords = 8;
    static constexpr std::size_t kBlock = SHA256_CBLOCK;
    static constexpr std::size_t kDigest = SHA256_DIGEST_LENGTH;

    static void Init(Ctx& c) { SHA256_Init(&c); }
    static void Update(Ctx& c, const void* p, std::size_t n) { SHA256_Update(&c, p, n); }
    static void Final(Ctx& c, unsigned char* out) { SHA256_Final(out, &c); }

    static void GetWords(const Ctx& c, Word* w) { std::copy(c.h, c.h + kWords, w); }
    static void SetWords(Ctx& c, const Word* w) { std::copy(w, w + kWords, c.h); }

    static std::uint64_t Length(const Ctx& c) {
        return ((static_cast<std::uint64_t>(c.Nh) << 32) | c.Nl) >> 3;
    }
    static void SetLength(Ctx& c, std::uint64_t len) {
        const std::uint64_t bits = len << 3;
        c.Nl = static_cast<SHA_LONG>(bits);
        c.Nh = static_cast<SHA_LONG>(bits >> 32);
        c.num = static_cast<unsigned int>(len % kBlock);
    }

    static const unsigned char* Block(const Ctx& c) { return reinterpret_cast<const unsigned char*>(c.data); }
    static unsigned char* Block(Ctx& c) { return reinterpret_cast<unsigned char*>(c.data); }
    static std::size_t Buffered(const Ctx& c) { return c.num; }
};

struct Sha512Traits {
    using Ctx = SHA512_CTX;
    using Word = std::uint64_t;
    static constexpr std::string_view kName = "SHA-512";
    static constexpr std::string_view kMagic{"sha\x07", 4};
    static constexpr std::size_t kWords = 8;
    static constexpr std::size_t kBlock = SHA512_CBLOCK;
    static constexpr std::size_t kDigest = SHA512_DIGEST_LENGTH;

    static void Init(Ctx& c) { SHA512_Init(&c); }
    static void Update(Ctx& c, const void* p, std::size_t n) { SHA512_Update(&c, p, n); }
    static void Final(Ctx& c, unsigned char* out) { SHA512_Final(out, &c); }

    static void GetWords(const Ctx& c, Word* w) { std::copy(c.h, c.h + kWords, w); }
    static void SetWords(Ctx& c, const Word* w) { std::copy(w, w + kWords, c.h); }

    // 128-bit bit counter split over Nl/Nh.
    static std::uint64_t Length(const Ctx& c) {
        return (static_cast<std::uint64_t>(c.Nl) >> 3) | (static_cast<std::uint64_t>(c.Nh) << 61);
    }
    static void SetLength(Ctx& c, std::uint64_t len) {
        c.Nl = static_cast<SHA_LONG64>(len << 3);
        c.Nh = static_cast<SHA_LONG64>(len >> 61);
        c.num = static_cast<unsigned int>(len % kBlock);
    }

    static const unsigned char* Block(const Ctx& c) { return c.u.p; }
    static unsigned char* Block(Ctx& c) { return c.u.p; }
    static std::size_t Buffered(const Ctx& c) { return c.num; }
};

// Layout: magic | chaining words (big-endian) | block, zero padded | byte count.
template <typename Traits>
class BlockDigestAccumulator final : public IAccumulator {
public:
    using Word = typename Traits::Word;
    static constexpr std::size_t kStateSize =
        Traits::kMagic.size() + Traits::kWords * sizeof(Word) + Traits::kBlock + 8;

    BlockDigestAccumulator() { Traits::Init(ctx_); }

    std::string_view Algorithm() const override { return Traits::kName; }
    std::size_t DigestSize() const override { return Traits::kDigest; }

    void Write(std::span<const std::uint8_t> data) override {
        if (data.empty()) return;
        Traits::Update(ctx_, data.data(), data.size());
    }

    Bytes Sum() const override {
        typename Traits::Ctx copy = ctx_;
        Bytes out(Traits::kDigest);
        Traits::Final(copy, out.data());
        return out;
    }

    Result ExportState(Bytes& out) const override {
        Bytes b;
        b.reserve(kStateSize);
        b.insert(b.end(), Traits::kMagic.begin(), Traits::kMagic.end());

        std::array<Word, Traits::kWords> words{};
        Traits::GetWords(ctx_, words.data());
        for (const Word w : words) {
            AppendWord<Word>(b, w);
        }

        const std::size_t buffered = Traits::Buffered(ctx_);
        const unsigned char* block = Traits::Block(ctx_);
        b.insert(b.end(), block, block + buffered);
        b.resize(b.size() + (Traits::kBlock - buffered), 0);

        AppendU64(b, Traits::Length(ctx_));
        out = std::move(b);
        return Result::Ok();
    }

    Result ImportState(std::span<const std::uint8_t> blob) override {
        if (blob.size() < Traits::kMagic.size() ||
            std::memcmp(blob.data(), Traits::kMagic.data(), Traits::kMagic.size()) != 0) {
            return Result::Fail(Errc::StateImportFailed,
                                std::string(Traits::kName) + ": invalid hash state identifier");
        }
        if (blob.size() != kStateSize) {
            return Result::Fail(Errc::StateImportFailed,
                                std::string(Traits::kName) + ": invalid hash state size");
        }

        typename Traits::Ctx ctx{};
        Traits::Init(ctx);

        const std::uint8_t* p = blob.data() + Traits::kMagic.size();
        std::array<Word, Traits::kWords> words{};
        for (auto& w : words) {
            w = ReadWord<Word>(p);
            p += sizeof(Word);
        }
        Traits::SetWords(ctx, words.data());

        const std::uint8_t* block = p;
        p += Traits::kBlock;
        const std::uint64_t len = ReadU64(p);
        Traits::SetLength(ctx, len);
        std::memcpy(Traits::Block(ctx), block, Traits::Buffered(ctx));

        ctx_ = ctx;
        return Result::Ok();
    }

private:
    typename Traits::Ctx ctx_{};
};

// Go's crc32 snapshots carry a checksum of the polynomial table so a state
// taken with one polynomial is never resumed with another.
std::uint32_t IeeeTableSum() {
    static const std::uint32_t sum = [] {
        const z_crc_t* table = get_crc_table();
        Bytes b;
        b.reserve(256 * 4);
        for (int i = 0; i < 256; ++i) {
            AppendU32(b, static_cast<std::uint32_t>(table[i]));
        }
        return static_cast<std::uint32_t>(crc32(0L, b.data(), static_cast<uInt>(b.size())));
    }();
    return sum;
}

// Layout: magic | table checksum | crc, all big-endian.
class Crc32Accumulator final : public IAccumulator {
public:
    static constexpr std::string_view kMagic{"crc\x01", 4};
    static constexpr std::size_t kStateSize = 4 + 4 + 4;

    std::string_view Algorithm() const override { return "CRC-32"; }
    std::size_t DigestSize() const override { return 4; }

    void Write(std::span<const std::uint8_t> data) override {
        const std::uint8_t* p = data.data();
        std::size_t left = data.size();
        while (left > 0) {
            const uInt n = static_cast<uInt>(std::min<std::size_t>(left, std::numeric_limits<uInt>::max()));
            crc_ = crc32(crc_, p, n);
            p += n;
            left -= n;
        }
    }

    Bytes Sum() const override {
        Bytes out;
        AppendU32(out, static_cast<std::uint32_t>(crc_));
        return out;
    }

    Result ExportState(Bytes& out) const override {
        Bytes b(kMagic.begin(), kMagic.end());
        AppendU32(b, IeeeTableSum());
        AppendU32(b, static_cast<std::uint32_t>(crc_));
        out = std::move(b);
        return Result::Ok();
    }

    Result ImportState(std::span<const std::uint8_t> blob) override {
        if (blob.size() < kMagic.size() || std::memcmp(blob.data(), kMagic.data(), kMagic.size()) != 0) {
            return Result::Fail(Errc::StateImportFailed, "CRC-32: invalid hash state identifier");
        }
        if (blob.size() != kStateSize) {
            return Result::Fail(Errc::StateImportFailed, "CRC-32: invalid hash state size");
        }
        if (ReadU32(blob.data() + 4) != IeeeTableSum()) {
            return Result::Fail(Errc::StateImportFailed, "CRC-32: tables do not match");
        }
        crc_ = ReadU32(blob.data() + 8);
        return Result::Ok();
    }

private:
    uLong crc_ = 0;
};

} // namespace

std::unique_ptr<IAccumulator> NewMd5Accumulator() {
    return std::make_unique<BlockDigestAccumulator<Md5Traits>>();
}

std::unique_ptr<IAccumulator> NewSha1Accumulator() {
    return std::make_unique<BlockDigestAccumulator<Sha1Traits>>();
}

std::unique_ptr<IAccumulator> NewSha256Accumulator() {
    return std::make_unique<BlockDigestAccumulator<Sha256Traits>>();
}

std::unique_ptr<IAccumulator> NewSha512Accumulator() {
    return std::make_unique<BlockDigestAccumulator<Sha512Traits>>();
}

std::unique_ptr<IAccumulator> NewCrc32Accumulator() {
    return std::make_unique<Crc32Accumulator>();
}

} // namespace rehash
