#include <gtest/gtest.h>
#include "rapidmcp/transport/stdio_transport.hpp"
#include "rapidmcp/error.hpp"
#include <unistd.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace rapidmcp;

// One pipe feeding the transport, one pipe collecting what it sends
class PipeFixture : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(in_), 0);
        ASSERT_EQ(::pipe(out_), 0);
        transport_ = std::make_unique<StdioTransport>(in_[0], out_[1]);
    }

    void TearDown() override {
        transport_.reset();
        for (int fd : {in_[0], in_[1], out_[0], out_[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }

    void feed(const std::string& data) {
        ASSERT_EQ(::write(in_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_input() {
        ::close(in_[1]);
        in_[1] = -1;
    }

    std::vector<std::string> run() {
        std::vector<std::string> units;
        transport_->start([&units](std::string_view unit) { units.emplace_back(unit); });
        return units;
    }

    std::string read_output(size_t n) {
        std::string data(n, '\0');
        size_t got = 0;
        while (got < n) {
            ssize_t r = ::read(out_[0], &data[got], n - got);
            if (r <= 0) break;
            got += static_cast<size_t>(r);
        }
        data.resize(got);
        return data;
    }

    int in_[2]{-1, -1};
    int out_[2]{-1, -1};
    std::unique_ptr<StdioTransport> transport_;
};

TEST_F(PipeFixture, SplitsLinesUntilEof) {
    feed("{\"a\":1}\n{\"b\":2}\n");
    close_input();
    auto units = run();
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0], "{\"a\":1}");
    EXPECT_EQ(units[1], "{\"b\":2}");
    EXPECT_FALSE(transport_->is_connected());
}

TEST_F(PipeFixture, SkipsBlankLinesAndStripsCr) {
    feed("\n   \n{\"x\":1}\r\n\t\n");
    close_input();
    auto units = run();
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0], "{\"x\":1}");
}

TEST_F(PipeFixture, FinalLineWithoutNewline) {
    feed("first\nlast");
    close_input();
    auto units = run();
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[1], "last");
}

TEST_F(PipeFixture, LongLineAcrossReads) {
    std::string big(20000, 'x');
    std::thread writer([this, &big]() {
        feed(big + "\n");
        close_input();
    });
    auto units = run();
    writer.join();
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].size(), big.size());
}

TEST_F(PipeFixture, SendAppendsNewline) {
    const std::string payload = R"({"jsonrpc":"2.0","id":1,"result":{}})";
    transport_->send(payload);
    EXPECT_EQ(read_output(payload.size() + 1), payload + "\n");
}

TEST_F(PipeFixture, ShutdownInterruptsBlockedRead) {
    std::thread reader([this]() { (void)run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    transport_->shutdown();
    reader.join();
    EXPECT_FALSE(transport_->is_connected());
    EXPECT_THROW(transport_->send("{}"), McpTransportError);
}

TEST_F(PipeFixture, ShutdownBeforeStartReturnsImmediately) {
    transport_->shutdown();
    auto units = run();
    EXPECT_TRUE(units.empty());
}

TEST_F(PipeFixture, CallbackCanSendFromReaderThread) {
    feed("ping\n");
    close_input();
    transport_->start([this](std::string_view unit) {
        transport_->send("pong:" + std::string(unit));
    });
    EXPECT_EQ(read_output(10), "pong:ping\n");
}
