#include <gtest/gtest.h>

#include "crypto/accumulators.hpp"
#include "crypto/digest_registry.hpp"
#include "testing.hpp"
#include "util/hex.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

using rehash::Bytes;
using testutil::AsBytes;

const std::string kGopher = "The tunneling gopher digs downwards, unaware of what he will find.";

std::unique_ptr<rehash::IAccumulator> Make(const std::string& alg) {
    std::unique_ptr<rehash::IAccumulator> acc;
    auto r = rehash::NewAccumulator(alg, acc);
    EXPECT_TRUE(r.ok) << r.msg;
    return acc;
}

std::string HexSum(const rehash::IAccumulator& acc) { return rehash::HexEncode(acc.Sum()); }

struct KnownDigest {
    const char* alg;
    const char* empty;
    const char* gopher;
};

const KnownDigest kKnown[] = {
    {"CRC-32", "00000000", "c7f0c124"},
    {"MD5", "d41d8cd98f00b204e9800998ecf8427e", "10386e7f42f8a0688bae01c7f5483410"},
    {"SHA-1", "da39a3ee5e6b4b0d3255bfef95601890afd80709", "16c244bf1146ae01276cd28da1dc7d9808e0b9d0"},
    {"SHA-256",
     "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
     "57d51a066f3a39942649cd9a76c77e97ceab246756ff3888659e6aa5a07f4a52"},
    {"SHA-512",
     "cf83e1357eefb8bdf1542850d66d8007d620e4050b5715dc83f4a921d36ce9ce"
     "47d0d13c5d85f2b0ff8318d2877eec2f63b931bd47417a81a538327af927da3e",
     "a7b54a7eb61445a16782e841649bf27d3424c7bd42e24d8dd64bef4161c20bf9"
     "ef370a9326ba813a42005dc2e5e3acb613ff3f5592fbef33b76568956bfd88cd"},
};

TEST(AccumulatorTests, KnownVectors) {
    for (const auto& k : kKnown) {
        auto acc = Make(k.alg);
        ASSERT_TRUE(acc);
        EXPECT_EQ(HexSum(*acc), k.empty) << k.alg;

        acc->Write(AsBytes(kGopher));
        EXPECT_EQ(HexSum(*acc), k.gopher) << k.alg;
        EXPECT_EQ(acc->Sum().size(), acc->DigestSize()) << k.alg;
        EXPECT_EQ(acc->Algorithm(), k.alg);
    }
}

TEST(AccumulatorTests, SumDoesNotDisturbRunningState) {
    for (const auto& k : kKnown) {
        auto acc = Make(k.alg);
        acc->Write(AsBytes(kGopher.substr(0, 10)));
        (void)acc->Sum();
        (void)acc->Sum();
        acc->Write(AsBytes(kGopher.substr(10)));
        EXPECT_EQ(HexSum(*acc), k.gopher) << k.alg;
    }
}

TEST(AccumulatorTests, StateBlobLayout) {
    struct Layout {
        const char* alg;
        std::string magic;
        size_t size;
    };
    const Layout layouts[] = {
        {"MD5", std::string("md5\x01", 4), 92},
        {"SHA-1", std::string("sha\x01", 4), 96},
        {"SHA-256", std::string("sha\x03", 4), 108},
        {"SHA-512", std::string("sha\x07", 4), 204},
        {"CRC-32", std::string("crc\x01", 4), 12},
    };

    for (const auto& l : layouts) {
        auto acc = Make(l.alg);
        acc->Write(AsBytes(kGopher));
        Bytes blob;
        auto r = acc->ExportState(blob);
        ASSERT_TRUE(r.ok) << r.msg;
        ASSERT_EQ(blob.size(), l.size) << l.alg;
        EXPECT_EQ(std::string(blob.begin(), blob.begin() + 4), l.magic) << l.alg;
    }
}

TEST(AccumulatorTests, StateBlobRecordsByteCount) {
    // The length field is the last 8 bytes of the block digests' layout.
    for (const char* alg : {"MD5", "SHA-1", "SHA-256", "SHA-512"}) {
        auto acc = Make(alg);
        acc->Write(AsBytes(kGopher));
        Bytes blob;
        ASSERT_TRUE(acc->ExportState(blob).ok);
        std::uint64_t len = 0;
        for (size_t i = blob.size() - 8; i < blob.size(); ++i)
            len = (len << 8) | blob[i];
        EXPECT_EQ(len, kGopher.size()) << alg;
    }
}

TEST(AccumulatorTests, ResumeAtEverySplitPoint) {
    const std::string data = testutil::Payload(300);

    for (const auto& alg : rehash::SupportedAlgorithms()) {
        auto whole = Make(alg);
        whole->Write(AsBytes(data));
        const std::string expected = HexSum(*whole);

        for (size_t k = 0; k <= data.size(); ++k) {
            auto first = Make(alg);
            first->Write(AsBytes(data.substr(0, k)));
            Bytes blob;
            ASSERT_TRUE(first->ExportState(blob).ok);

            auto second = Make(alg);
            auto r = second->ImportState(blob);
            ASSERT_TRUE(r.ok) << alg << " k=" << k << ": " << r.msg;
            second->Write(AsBytes(data.substr(k)));
            ASSERT_EQ(HexSum(*second), expected) << alg << " k=" << k;
        }
    }
}

TEST(AccumulatorTests, ImportRejectsForeignIdentifier) {
    auto md5 = Make("MD5");
    Bytes blob;
    ASSERT_TRUE(md5->ExportState(blob).ok);

    auto sha1 = Make("SHA-1");
    auto r = sha1->ImportState(blob);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, rehash::Errc::StateImportFailed);
    EXPECT_NE(r.msg.find("invalid hash state identifier"), std::string::npos) << r.msg;
}

TEST(AccumulatorTests, ImportRejectsTruncatedBlob) {
    for (const auto& alg : rehash::SupportedAlgorithms()) {
        auto acc = Make(alg);
        Bytes blob;
        ASSERT_TRUE(acc->ExportState(blob).ok);
        blob.pop_back();

        auto fresh = Make(alg);
        auto r = fresh->ImportState(blob);
        EXPECT_FALSE(r.ok) << alg;
        EXPECT_EQ(r.err, rehash::Errc::StateImportFailed) << alg;
        EXPECT_NE(r.msg.find("invalid hash state size"), std::string::npos) << r.msg;
    }
}

TEST(AccumulatorTests, Crc32RejectsForeignTable) {
    auto acc = Make("CRC-32");
    Bytes blob;
    ASSERT_TRUE(acc->ExportState(blob).ok);
    blob[4] ^= 0xFF;

    auto fresh = Make("CRC-32");
    auto r = fresh->ImportState(blob);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, rehash::Errc::StateImportFailed);
    EXPECT_EQ(r.msg, "CRC-32: tables do not match");
}

TEST(AccumulatorTests, Crc32StateCarriesIeeeTableSum) {
    auto acc = Make("CRC-32");
    Bytes blob;
    ASSERT_TRUE(acc->ExportState(blob).ok);
    const Bytes sum(blob.begin() + 4, blob.begin() + 8);
    EXPECT_EQ(rehash::HexEncode(sum), "ca87914d");
}

} // namespace
