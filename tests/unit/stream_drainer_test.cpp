/**
 * @file stream_drainer_test.cpp
 * @brief Unit tests for StreamDrainer line handling and discovery
 *
 * Each test feeds a pipe() from the test thread and collects lines through
 * the sink. Tests:
 * - Lines split across writes are reassembled
 * - Final unterminated line is delivered at end-of-stream
 * - CRLF line endings
 * - Discovery on stdout only
 * - Over-long lines are chunked and never parsed
 * - request_stop ends the loop while the pipe is still open
 */

#include "sidecar/stream_drainer.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tether::sidecar;

class StreamDrainerTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(pipe(fds), 0);
        read_fd_ = fds[0];
        write_fd_ = fds[1];
        registry_ = std::make_shared<PortRegistry>();
    }

    void TearDown() override { close_writer(); }

    std::unique_ptr<StreamDrainer> make_drainer(Channel channel) {
        auto sink = [this](Channel, const std::string &line) {
            std::lock_guard<std::mutex> lock(lines_mutex_);
            lines_.push_back(line);
        };
        auto drainer = std::make_unique<StreamDrainer>(channel, read_fd_, sink, registry_);
        read_fd_ = -1;  // owned by the drainer now
        return drainer;
    }

    void write_all(const std::string &data) {
        size_t offset = 0;
        while (offset < data.size()) {
            ssize_t n = write(write_fd_, data.data() + offset, data.size() - offset);
            ASSERT_GT(n, 0);
            offset += static_cast<size_t>(n);
        }
    }

    void close_writer() {
        if (write_fd_ >= 0) {
            close(write_fd_);
            write_fd_ = -1;
        }
        if (read_fd_ >= 0) {
            close(read_fd_);
            read_fd_ = -1;
        }
    }

    void finish(StreamDrainer &drainer) {
        close_writer();
        ASSERT_TRUE(drainer.wait_finished(std::chrono::seconds(5)));
        drainer.join();
    }

    std::vector<std::string> lines() {
        std::lock_guard<std::mutex> lock(lines_mutex_);
        return lines_;
    }

    int read_fd_ = -1;
    int write_fd_ = -1;
    std::shared_ptr<PortRegistry> registry_;

    std::mutex lines_mutex_;
    std::vector<std::string> lines_;
};

TEST_F(StreamDrainerTest, ReassemblesPartialWrites) {
    auto drainer = make_drainer(Channel::STDOUT);
    drainer->start();

    write_all("hel");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    write_all("lo\nwor");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    write_all("ld\n");
    finish(*drainer);

    EXPECT_EQ(lines(), (std::vector<std::string>{"hello", "world"}));
    EXPECT_EQ(drainer->line_count(), 2u);
}

TEST_F(StreamDrainerTest, DeliversUnterminatedFinalLine) {
    auto drainer = make_drainer(Channel::STDOUT);
    drainer->start();

    write_all("first\nPORT:4242");
    finish(*drainer);

    EXPECT_EQ(lines(), (std::vector<std::string>{"first", "PORT:4242"}));
    ASSERT_TRUE(registry_->get().has_value());
    EXPECT_EQ(*registry_->get(), 4242);
}

TEST_F(StreamDrainerTest, StripsCarriageReturns) {
    auto drainer = make_drainer(Channel::STDOUT);
    drainer->start();

    write_all("booting\r\nPORT:8001\r\n");
    finish(*drainer);

    EXPECT_EQ(lines(), (std::vector<std::string>{"booting", "PORT:8001"}));
    EXPECT_EQ(*registry_->get(), 8001);
}

TEST_F(StreamDrainerTest, DiscoversPortAmongOtherOutput) {
    auto drainer = make_drainer(Channel::STDOUT);
    drainer->start();

    write_all("INFO starting\nPORT:notaport\nPORT:54321\nINFO ready\n");
    finish(*drainer);

    EXPECT_EQ(lines().size(), 4u);
    EXPECT_EQ(*registry_->get(), 54321);
    EXPECT_EQ(registry_->announcement_count(), 1u);
}

TEST_F(StreamDrainerTest, StderrIsNeverParsed) {
    auto drainer = make_drainer(Channel::STDERR);
    drainer->start();

    write_all("PORT:54321\n");
    finish(*drainer);

    EXPECT_EQ(lines(), (std::vector<std::string>{"PORT:54321"}));
    EXPECT_FALSE(registry_->get().has_value());
}

TEST_F(StreamDrainerTest, ChunksOverlongLinesWithoutParsing) {
    auto drainer = make_drainer(Channel::STDOUT);
    drainer->start();

    // A discovery-looking line padded past the limit must not register
    std::string overlong = "PORT:1234" + std::string(kMaxLineLength, '0');
    write_all(overlong + "\nPORT:5555\n");
    finish(*drainer);

    auto received = lines();
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0].size(), kMaxLineLength);
    EXPECT_EQ(received[0] + received[1], overlong);
    EXPECT_EQ(received[2], "PORT:5555");

    EXPECT_EQ(*registry_->get(), 5555);
    EXPECT_EQ(registry_->announcement_count(), 1u);
}

TEST_F(StreamDrainerTest, KeepsUpWithHighVolume) {
    auto drainer = make_drainer(Channel::STDOUT);
    drainer->start();

    std::string batch;
    for (int i = 0; i < 1000; ++i) {
        batch += "line " + std::to_string(i) + "\n";
    }
    for (int i = 0; i < 20; ++i) {
        write_all(batch);
    }
    write_all("PORT:9999\n");
    finish(*drainer);

    EXPECT_EQ(drainer->line_count(), 20001u);
    EXPECT_EQ(*registry_->get(), 9999);
}

TEST_F(StreamDrainerTest, RequestStopEndsLoopWhilePipeOpen) {
    auto drainer = make_drainer(Channel::STDOUT);
    drainer->start();

    write_all("still open\n");
    EXPECT_FALSE(drainer->wait_finished(std::chrono::milliseconds(150)));

    drainer->request_stop();
    EXPECT_TRUE(drainer->wait_finished(std::chrono::seconds(2)));
    drainer->join();
    EXPECT_TRUE(drainer->finished());
}

TEST_F(StreamDrainerTest, SinkExceptionDoesNotStopDraining) {
    int calls = 0;
    auto sink = [&calls](Channel, const std::string &) {
        ++calls;
        throw std::runtime_error("sink failure");
    };
    StreamDrainer drainer(Channel::STDOUT, read_fd_, sink, registry_);
    read_fd_ = -1;
    drainer.start();

    write_all("a\nPORT:7000\n");
    finish(drainer);

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(*registry_->get(), 7000);
}

TEST(StreamDrainerChannelTest, ChannelNames) {
    EXPECT_STREQ(channel_name(Channel::STDOUT), "stdout");
    EXPECT_STREQ(channel_name(Channel::STDERR), "stderr");
}
