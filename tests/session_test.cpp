#include <gtest/gtest.h>
#include "session.hpp"
#include "errors.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;
using transfer::TransferSession;
using State = transfer::TransferSession::State;
using test_util::TempDir;
using test_util::read_file;

class TransferSessionTest : public ::testing::Test {
protected:
    TransferSession make_session() {
        return TransferSession(dir.path(), [this](const fs::path& archive_path) {
            ++completions;
            completed_path = archive_path;
            completed_content = read_file(archive_path);
        });
    }

    TempDir dir;
    int completions = 0;
    fs::path completed_path;
    std::string completed_content;
};

TEST_F(TransferSessionTest, CompletesOnExactlyTheDeclaredByte) {
    auto session = make_session();
    EXPECT_EQ(session.consume("mystuff.tar\n12\n"), State::RECEIVING_DATA);
    EXPECT_EQ(session.archive_name(), "mystuff.tar");
    EXPECT_EQ(session.declared_size(), 12u);
    EXPECT_TRUE(fs::exists(dir / "new_mystuff.tar"));

    EXPECT_EQ(session.consume("hello"), State::RECEIVING_DATA);
    EXPECT_EQ(session.consume("world!"), State::RECEIVING_DATA);
    EXPECT_EQ(session.bytes_received(), 11u);
    EXPECT_EQ(completions, 0);

    EXPECT_EQ(session.consume("?"), State::COMPLETE);
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(completed_path, dir / "new_mystuff.tar");
    // Sink was closed before the callback ran, so all bytes are visible
    EXPECT_EQ(completed_content, "helloworld!?");
}

TEST_F(TransferSessionTest, HeaderSplitAcrossFrames) {
    auto session = make_session();
    EXPECT_EQ(session.consume("mystu"), State::AWAITING_HEADER);
    EXPECT_EQ(session.consume("ff.tar\n1"), State::AWAITING_HEADER);
    EXPECT_FALSE(fs::exists(dir / "new_mystuff.tar"));
    EXPECT_EQ(session.consume("2\nab"), State::RECEIVING_DATA);
    EXPECT_EQ(session.bytes_received(), 2u);
    EXPECT_EQ(session.consume("cdefghijkl"), State::COMPLETE);
    EXPECT_EQ(completed_content, "abcdefghijkl");
}

TEST_F(TransferSessionTest, RemainderCanCompleteImmediately) {
    auto session = make_session();
    EXPECT_EQ(session.consume("a.tar\n3\nxyz"), State::COMPLETE);
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(completed_content, "xyz");
}

TEST_F(TransferSessionTest, ZeroSizeCompletesOnHeader) {
    auto session = make_session();
    EXPECT_EQ(session.consume("empty.tar\n0\n"), State::COMPLETE);
    EXPECT_EQ(completions, 1);
    EXPECT_TRUE(completed_content.empty());
}

TEST_F(TransferSessionTest, EmptyDataFramesAreHarmless) {
    auto session = make_session();
    session.consume("a.tar\n2\n");
    EXPECT_EQ(session.consume(""), State::RECEIVING_DATA);
    EXPECT_EQ(session.consume("ab"), State::COMPLETE);
}

TEST_F(TransferSessionTest, OneExtraByteIsRejected) {
    auto session = make_session();
    session.consume("mystuff.tar\n12\n");
    session.consume("hello world");
    EXPECT_THROW(session.consume("!!"), errors::OverlongTransferError);
    EXPECT_EQ(completions, 0);
    EXPECT_EQ(session.bytes_received(), 11u);
}

TEST_F(TransferSessionTest, OverlongRemainderIsRejected) {
    auto session = make_session();
    EXPECT_THROW(session.consume("a.tar\n2\nabc"), errors::OverlongTransferError);
    EXPECT_EQ(completions, 0);
}

TEST_F(TransferSessionTest, DataAfterCompletionIsRejected) {
    auto session = make_session();
    session.consume("a.tar\n1\nz");
    EXPECT_THROW(session.consume("more"), errors::OverlongTransferError);
    EXPECT_EQ(completions, 1);
}

TEST_F(TransferSessionTest, MalformedSizeIsRejected) {
    auto session = make_session();
    EXPECT_THROW(session.consume("a.tar\nlots\n"), errors::MalformedHeaderError);
    EXPECT_FALSE(fs::exists(dir / "new_a.tar"));
}

TEST_F(TransferSessionTest, UnwritableSinkIsDecodeError) {
    TransferSession session(dir / "missing_dir", nullptr);
    EXPECT_THROW(session.consume("a.tar\n1\n"), errors::DecodeError);
}
