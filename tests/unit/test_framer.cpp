/**
 * @file test_framer.cpp
 * @brief Unit tests for LineFramer and StdioTransport
 */

#include <gtest/gtest.h>
#include <csignal>
#include <thread>
#include <vector>
#include <unistd.h>
#include <fcntl.h>
#include "remindd/rpc/transport.h"
#include "remindd/logger.h"

class FramerTest : public ::testing::Test {
protected:
    void SetUp() override {
        remindd::Logger::init(remindd::LogLevel::CRITICAL, false);
    }

    void TearDown() override {
        remindd::Logger::shutdown();
    }
};

// ============================================================================
// LineFramer
// ============================================================================

TEST_F(FramerTest, EmitsOnlyCompleteLines) {
    remindd::LineFramer framer(1024);
    framer.feed("{\"a\":");
    EXPECT_FALSE(framer.next().has_value());

    framer.feed("1}\n{\"b\"");
    auto first = framer.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "{\"a\":1}");
    EXPECT_FALSE(framer.next().has_value());

    framer.feed(":2}\n");
    auto second = framer.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "{\"b\":2}");
}

TEST_F(FramerTest, SplitsMultipleLinesFromOneChunk) {
    remindd::LineFramer framer(1024);
    framer.feed("one\ntwo\nthree\n");

    std::vector<std::string> lines;
    while (auto line = framer.next()) {
        lines.push_back(*line);
    }
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST_F(FramerTest, StripsCarriageReturnAndSkipsBlankLines) {
    remindd::LineFramer framer(1024);
    framer.feed("\n\r\n  \nping\r\n\n");

    auto line = framer.next();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "ping");
    EXPECT_FALSE(framer.next().has_value());
}

TEST_F(FramerTest, ByteAtATimeFeeding) {
    remindd::LineFramer framer(1024);
    std::string input = "{\"jsonrpc\":\"2.0\"}\n";
    std::vector<std::string> lines;
    for (char c : input) {
        framer.feed(&c, 1);
        while (auto line = framer.next()) {
            lines.push_back(*line);
        }
    }
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{\"jsonrpc\":\"2.0\"}");
}

TEST_F(FramerTest, FinishFlushesUnterminatedTail) {
    remindd::LineFramer framer(1024);
    framer.feed("done\n{\"id\":1,");
    ASSERT_TRUE(framer.next().has_value());
    EXPECT_FALSE(framer.next().has_value());

    auto tail = framer.finish();
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, "{\"id\":1,");
    EXPECT_FALSE(framer.finish().has_value());
}

TEST_F(FramerTest, FinishIgnoresBlankTail) {
    remindd::LineFramer framer(1024);
    framer.feed("  \r");
    EXPECT_FALSE(framer.finish().has_value());
}

TEST_F(FramerTest, OversizedPendingLineThrows) {
    remindd::LineFramer framer(1024);
    std::string big(2000, 'x');
    EXPECT_THROW(framer.feed(big), remindd::TransportError);
}

TEST_F(FramerTest, OversizedCompleteLineThrows) {
    remindd::LineFramer framer(1024);
    std::string big(1500, 'x');
    big.push_back('\n');
    // The newline arrives in the same chunk, so feed accepts it
    framer.feed(big);
    EXPECT_THROW(framer.next(), remindd::TransportError);
}

TEST_F(FramerTest, LineAtLimitIsAccepted) {
    remindd::LineFramer framer(1024);
    std::string exact(1024, 'y');
    framer.feed(exact + "\n");
    auto line = framer.next();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->size(), 1024u);
}

// ============================================================================
// StdioTransport over pipes
// ============================================================================

class TransportTest : public FramerTest {
protected:
    void SetUp() override {
        FramerTest::SetUp();
        ASSERT_EQ(pipe(in_), 0);
        ASSERT_EQ(pipe(out_), 0);
    }

    void TearDown() override {
        for (int fd : {in_[0], in_[1], out_[0], out_[1]}) {
            if (fd >= 0) {
                close(fd);
            }
        }
        FramerTest::TearDown();
    }

    void write_input(const std::string& data) {
        ASSERT_EQ(write(in_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_input() {
        close(in_[1]);
        in_[1] = -1;
    }

    std::string read_output() {
        close(out_[1]);
        out_[1] = -1;
        std::string result;
        char buf[4096];
        ssize_t n;
        while ((n = read(out_[0], buf, sizeof(buf))) > 0) {
            result.append(buf, static_cast<size_t>(n));
        }
        return result;
    }

    int in_[2] = {-1, -1};
    int out_[2] = {-1, -1};
};

TEST_F(TransportTest, ReadsFramesThenEndOfStream) {
    remindd::StdioTransport transport(in_[0], out_[1], 1024);
    write_input("a\nb\n");
    close_input();

    std::vector<std::string> frames;
    std::string frame;
    for (int i = 0; i < 20; ++i) {
        auto status = transport.read_frame(frame, 50);
        if (status == remindd::StdioTransport::ReadStatus::FRAME) {
            frames.push_back(frame);
        } else if (status == remindd::StdioTransport::ReadStatus::END_OF_STREAM) {
            break;
        }
    }
    EXPECT_EQ(frames, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(transport.read_frame(frame, 10), remindd::StdioTransport::ReadStatus::END_OF_STREAM);
}

TEST_F(TransportTest, TimesOutWithoutInput) {
    remindd::StdioTransport transport(in_[0], out_[1], 1024);
    std::string frame;
    EXPECT_EQ(transport.read_frame(frame, 10), remindd::StdioTransport::ReadStatus::TIMEOUT);
}

TEST_F(TransportTest, FlushesTailAtEndOfStream) {
    remindd::StdioTransport transport(in_[0], out_[1], 1024);
    write_input("{\"id\":1,");
    close_input();

    std::string frame;
    remindd::StdioTransport::ReadStatus status;
    do {
        status = transport.read_frame(frame, 50);
    } while (status == remindd::StdioTransport::ReadStatus::TIMEOUT);

    ASSERT_EQ(status, remindd::StdioTransport::ReadStatus::FRAME);
    EXPECT_EQ(frame, "{\"id\":1,");
}

TEST_F(TransportTest, OversizedInputThrows) {
    remindd::StdioTransport transport(in_[0], out_[1], 1024);
    write_input(std::string(3000, 'z'));

    std::string frame;
    EXPECT_THROW({
        for (int i = 0; i < 10; ++i) {
            transport.read_frame(frame, 50);
        }
    }, remindd::TransportError);
}

TEST_F(TransportTest, WritesOneLinePerMessage) {
    remindd::StdioTransport transport(in_[0], out_[1], 1024);
    ASSERT_TRUE(transport.write_message("{\"id\":1}"));
    ASSERT_TRUE(transport.write_message("{\"id\":2}"));
    EXPECT_EQ(transport.messages_written(), 2u);

    EXPECT_EQ(read_output(), "{\"id\":1}\n{\"id\":2}\n");
}

TEST_F(TransportTest, ConcurrentWritesNeverInterleave) {
    remindd::StdioTransport transport(in_[0], out_[1], 1024);
    // Drain concurrently so large bursts cannot fill the pipe
    std::string collected;
    std::thread reader([&] {
        char buf[4096];
        ssize_t n;
        while ((n = read(out_[0], buf, sizeof(buf))) > 0) {
            collected.append(buf, static_cast<size_t>(n));
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&, t] {
            std::string payload(500, static_cast<char>('a' + t));
            for (int i = 0; i < 50; ++i) {
                transport.write_message(payload);
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    close(out_[1]);
    out_[1] = -1;
    reader.join();

    size_t lines = 0;
    size_t start = 0;
    while (start < collected.size()) {
        size_t end = collected.find('\n', start);
        ASSERT_NE(end, std::string::npos);
        std::string line = collected.substr(start, end - start);
        ASSERT_EQ(line.size(), 500u);
        EXPECT_EQ(line.find_first_not_of(line[0]), std::string::npos);
        ++lines;
        start = end + 1;
    }
    EXPECT_EQ(lines, 200u);
}

TEST_F(TransportTest, WriteToClosedPipeFails) {
    signal(SIGPIPE, SIG_IGN);
    remindd::StdioTransport transport(in_[0], out_[1], 1024);
    close(out_[0]);
    out_[0] = -1;
    EXPECT_FALSE(transport.write_message("{}"));
}
