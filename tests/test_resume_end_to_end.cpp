#include <gtest/gtest.h>

#include "crypto/accumulator_set.hpp"
#include "crypto/digest_registry.hpp"
#include "engine/checksums.hpp"
#include "io/file_reader.hpp"
#include "testing.hpp"
#include "util/session_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using rehash::AccumulatorSet;
using rehash::CancelToken;
using rehash::ComputeOutcome;
using rehash::EngineOptions;

// Passes reads through and cancels once `limit` bytes have been handed out.
class CancelAtReader final : public rehash::IReader {
  public:
    CancelAtReader(std::unique_ptr<rehash::IReader> inner, std::uint64_t limit, CancelToken token)
        : inner_(std::move(inner)), limit_(limit), token_(std::move(token)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = inner_->Read(out);
        if (n > 0) {
            served_ += static_cast<std::uint64_t>(n);
            if (served_ >= limit_)
                token_.Cancel();
        }
        return n;
    }

    std::optional<std::uint64_t> TotalSize() const override { return inner_->TotalSize(); }
    void Close() override { inner_->Close(); }

  private:
    std::unique_ptr<rehash::IReader> inner_;
    std::uint64_t limit_;
    std::uint64_t served_ = 0;
    CancelToken token_;
};

class ResumeEndToEndTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }

    static std::unique_ptr<rehash::FileOrStdinReader> OpenAt(const std::string& path, std::uint64_t offset) {
        auto reader = std::make_unique<rehash::FileOrStdinReader>();
        auto r = rehash::FileOrStdinReader::Open(path, offset, *reader);
        EXPECT_TRUE(r.ok) << r.msg;
        return reader;
    }

    static rehash::DigestMap Reference(const std::string& data) {
        AccumulatorSet set;
        EXPECT_TRUE(AccumulatorSet::Create(rehash::SupportedAlgorithms(), set).ok);
        EXPECT_TRUE(set.Write(testutil::AsBytes(data)).ok);
        return set.Digests();
    }
};

TEST_F(ResumeEndToEndTests, StopSaveLoadResume) {
    const std::string input = MakePath("image.bin");
    const std::string data = testutil::Payload(64 * 1024 + 123);
    testutil::WriteFile(input, data);

    EngineOptions opt;
    opt.buffer_size = 4096;

    // First run: stop halfway and persist the session.
    CancelToken cancel;
    AccumulatorSet set;
    ASSERT_TRUE(AccumulatorSet::Create(rehash::SupportedAlgorithms(), set).ok);
    auto half = std::make_unique<CancelAtReader>(OpenAt(input, 0), data.size() / 2, cancel);

    ComputeOutcome first;
    auto r = rehash::Compute(std::move(half), std::move(set), opt, cancel, first);
    ASSERT_TRUE(r.ok) << r.msg;
    ASSERT_FALSE(first.completed);
    ASSERT_TRUE(first.session.has_value());
    EXPECT_GE(first.offset, data.size() / 2);
    EXPECT_LT(first.offset, data.size());
    EXPECT_EQ(first.offset % 4096, 0u);

    const std::string session_path = MakePath("image.bin.rehash.json");
    ASSERT_TRUE(rehash::SaveSession(session_path, *first.session).ok);

    // Second run: a new process would start here.
    rehash::SavedSession session;
    r = rehash::LoadSession(session_path, session);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(session.computed, first.offset);

    AccumulatorSet resumed;
    r = AccumulatorSet::Restore(session, {}, resumed);
    ASSERT_TRUE(r.ok) << r.msg;

    ComputeOutcome second;
    r = rehash::Compute(OpenAt(input, session.computed), std::move(resumed), opt, {}, second);
    ASSERT_TRUE(r.ok) << r.msg;
    ASSERT_TRUE(second.completed);
    EXPECT_EQ(second.processed, data.size() - session.computed);
    EXPECT_EQ(second.offset, data.size());
    EXPECT_EQ(second.digests, Reference(data));
}

TEST_F(ResumeEndToEndTests, SeveralStopsInARow) {
    const std::string input = MakePath("multi.bin");
    const std::string data = testutil::Payload(10000);
    testutil::WriteFile(input, data);

    EngineOptions opt;
    opt.buffer_size = 512;

    std::optional<rehash::SavedSession> session;
    ComputeOutcome out;
    for (int round = 0; round < 20 && !out.completed; ++round) {
        AccumulatorSet set;
        std::uint64_t offset = 0;
        if (session) {
            ASSERT_TRUE(AccumulatorSet::Restore(*session, {"md5", "crc-32"}, set).ok);
            offset = session->computed;
        } else {
            ASSERT_TRUE(AccumulatorSet::Create({"MD5", "CRC-32"}, set).ok);
        }

        CancelToken cancel;
        auto reader = std::make_unique<CancelAtReader>(OpenAt(input, offset), 1500, cancel);
        auto r = rehash::Compute(std::move(reader), std::move(set), opt, cancel, out);
        ASSERT_TRUE(r.ok) << r.msg;
        if (!out.completed) {
            ASSERT_TRUE(out.session.has_value());
            ASSERT_GT(out.session->computed, offset);
            session = out.session;
        }
    }

    ASSERT_TRUE(out.completed);
    const auto reference = Reference(data);
    EXPECT_EQ(out.digests.at("MD5"), reference.at("MD5"));
    EXPECT_EQ(out.digests.at("CRC-32"), reference.at("CRC-32"));
}

TEST_F(ResumeEndToEndTests, SessionPastEndOfFileIsRejected) {
    const std::string input = MakePath("short.bin");
    testutil::WriteFile(input, testutil::Payload(100));

    rehash::FileOrStdinReader reader;
    auto r = rehash::FileOrStdinReader::Open(input, 101, reader);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, rehash::Errc::IncorrectComputedSize);
}

TEST_F(ResumeEndToEndTests, ResumeWithOtherAlgorithmsIsRejected) {
    AccumulatorSet set;
    ASSERT_TRUE(AccumulatorSet::Create({"SHA-256"}, set).ok);
    rehash::StateMap states;
    ASSERT_TRUE(set.ExportState(states).ok);

    const std::string session_path = MakePath("s.json");
    ASSERT_TRUE(rehash::SaveSession(session_path, rehash::SavedSession{.computed = 0, .states = states}).ok);

    rehash::SavedSession session;
    ASSERT_TRUE(rehash::LoadSession(session_path, session).ok);
    AccumulatorSet resumed;
    auto r = AccumulatorSet::Restore(session, {"SHA-512"}, resumed);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, rehash::Errc::AlgorithmSetMismatch);
}

} // namespace
