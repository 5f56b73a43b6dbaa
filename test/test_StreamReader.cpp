#include "jobwatch/StreamReader.hpp"

#include <functional>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "test_utils.h"

namespace jobwatch::test {

class StreamReaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto pipe = make_pipe();
    ASSERT_TRUE(pipe.has_value()) << pipe.error().message();
    reader_ = std::make_unique<StreamReader>(std::move(pipe->first), 10ms);
    writer_ = std::move(pipe->second);
  }

  void TearDown() override {
    writer_.reset();
    reader_.reset();
  }

  bool wait_for(std::function<bool()> const& condition, std::chrono::milliseconds timeout = 2000ms) {
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(2ms);
    }
    return true;
  }

  std::unique_ptr<StreamReader> reader_;
  FileDescriptor                writer_;
};

TEST_F(StreamReaderTest, ReadWithoutDataIsEmptyAndRepeatable) {
  reader_->start();
  for (int i = 0; i < 5; ++i) {
    EXPECT_FALSE(reader_->has_data());
    EXPECT_EQ(reader_->read(), "");
  }
}

TEST_F(StreamReaderTest, ReadBeforeStartIsEmpty) {
  EXPECT_FALSE(reader_->started());
  EXPECT_FALSE(reader_->has_data());
  EXPECT_EQ(reader_->read(), "");
}

TEST_F(StreamReaderTest, DeliversWrittenBytes) {
  reader_->start();
  write_all(writer_.get(), "hello\n");

  ASSERT_TRUE(wait_for([this] { return reader_->has_data(); }));
  EXPECT_EQ(reader_->read(), "hello\n");
  EXPECT_FALSE(reader_->has_data());
  EXPECT_EQ(reader_->read(), "");
}

TEST_F(StreamReaderTest, OverflowIsCoalescedInArrivalOrder) {
  reader_->start();

  write_all(writer_.get(), "a");
  ASSERT_TRUE(wait_for([this] { return reader_->has_data(); }));

  // slot is occupied: these go to the overflow list
  write_all(writer_.get(), "b");
  std::this_thread::sleep_for(50ms);
  write_all(writer_.get(), "c");
  std::this_thread::sleep_for(50ms);

  EXPECT_EQ(reader_->read(), "a");
  EXPECT_TRUE(reader_->has_data());
  EXPECT_EQ(reader_->read(), "bc");
  EXPECT_EQ(reader_->read(), "");
}

TEST_F(StreamReaderTest, OverflowIsPrependedToNextChunk) {
  reader_->start();

  write_all(writer_.get(), "1");
  ASSERT_TRUE(wait_for([this] { return reader_->has_data(); }));
  write_all(writer_.get(), "2");
  std::this_thread::sleep_for(50ms);

  std::string seen = reader_->read();
  write_all(writer_.get(), "3");
  seen += collect(*reader_, 2, 5ms, 2000ms);

  EXPECT_EQ(seen, "123");
}

TEST_F(StreamReaderTest, SlowConsumerLosesNothing) {
  reader_->start();

  std::string expected;
  for (int i = 0; i < 60; ++i) {
    expected += fmt::format("chunk-{:03}\n", i);
  }

  std::thread producer([this] {
    for (int i = 0; i < 60; ++i) {
      write_all(writer_.get(), fmt::format("chunk-{:03}\n", i));
      std::this_thread::sleep_for(10ms);
    }
  });

  // read only every 500ms while the producer writes every 10ms
  std::string seen;
  auto const  deadline = std::chrono::steady_clock::now() + 5s;
  while (seen.size() < expected.size() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(500ms);
    seen += reader_->read();
  }
  producer.join();

  EXPECT_EQ(seen, expected);
}

TEST_F(StreamReaderTest, StopDrainsPendingBytesAndCloses) {
  reader_->start();
  write_all(writer_.get(), "tail");
  reader_->stop();

  ASSERT_TRUE(wait_for([this] { return reader_->finished(); }));
  EXPECT_EQ(reader_->read(), "tail");
  EXPECT_EQ(reader_->read(), "");
}

TEST_F(StreamReaderTest, DetectsEndOfFile) {
  reader_->start();
  write_all(writer_.get(), "last");
  writer_.reset();

  ASSERT_TRUE(wait_for([this] { return reader_->at_eof(); }));
  EXPECT_EQ(reader_->read(), "last");
  EXPECT_FALSE(reader_->finished());

  reader_->stop();
  EXPECT_TRUE(wait_for([this] { return reader_->finished(); }));
}

TEST_F(StreamReaderTest, StopBeforeStartFinishesImmediately) {
  reader_->stop();
  EXPECT_TRUE(reader_->finished());
  reader_->start();
  EXPECT_FALSE(reader_->started());
}

TEST_F(StreamReaderTest, StartTwiceIsHarmless) {
  reader_->start();
  reader_->start();
  write_all(writer_.get(), "once");
  EXPECT_EQ(collect(*reader_, 4), "once");
}

} // namespace jobwatch::test
