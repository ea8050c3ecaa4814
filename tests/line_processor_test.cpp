#include "streaming/file_streamer.hpp"
#include "streaming/line_feed.hpp"
#include "streaming/line_processor.hpp"
#include "test_support.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using streaming::LineFeed;
using streaming::LineProcessor;
using testing_support::CaptureLogger;
using testing_support::MemorySink;
using testing_support::TempDir;

namespace {

// Forwards every sent line into a LineFeed, as a transport would.
class FeedSender : public transport::TextSender {
public:
  explicit FeedSender(LineFeed &feed) : feed_(feed) {}
  core::Status SendText(std::string_view text) override {
    feed_.PushLine(std::string(text));
    return {};
  }

private:
  LineFeed &feed_;
};

} // namespace

TEST(LineProcessor, ThreeLinesEndToEnd) {
  TempDir dir;
  auto input = dir.Write("in.txt", "Line 1\nLine 2\nLine 3\n");
  auto output = dir.File("out.txt");
  CaptureLogger log;
  LineFeed feed;

  std::jthread producer([&] {
    FeedSender sender(feed);
    auto st = streaming::FileStreamer(log).Stream(sender, input, 1ms);
    if (!st) {
      feed.PushError(st.error());
    }
    feed.CloseLines();
  });
  auto result = LineProcessor(log).Process(feed, output);
  producer.join();

  EXPECT_TRUE(result.Ok());
  EXPECT_EQ(result.stats.lines, 3u);
  EXPECT_EQ(testing_support::ReadFile(output), "Line 1\nLine 2\nLine 3\n");
  EXPECT_GE(result.stats.elapsed, 2ms);
  EXPECT_TRUE(log.Contains("Received 3 lines in"));
}

TEST(LineProcessor, ErrorWithoutLinesIsReported) {
  CaptureLogger log;
  LineFeed feed;
  MemorySink sink;
  feed.PushError(core::Error{core::ErrorKind::transport, "disk full"});

  auto result = LineProcessor(log).Process(feed, sink);
  EXPECT_EQ(result.stats.lines, 0u);
  ASSERT_TRUE(result.error);
  EXPECT_EQ(result.error->message, "disk full");
  EXPECT_TRUE(sink.content.empty());
}

TEST(LineProcessor, EndOfStreamAfterLinesIsSuccess) {
  CaptureLogger log;
  LineFeed feed;
  MemorySink sink;
  feed.PushLine("a");
  feed.PushLine("b");
  feed.PushError(core::EndOfStream());

  auto result = LineProcessor(log).Process(feed, sink);
  EXPECT_TRUE(result.Ok());
  EXPECT_EQ(result.stats.lines, 2u);
  EXPECT_EQ(sink.content, "a\nb\n");
}

TEST(LineProcessor, EndOfStreamMatchesCleanClose) {
  CaptureLogger log;
  LineFeed eof_feed;
  LineFeed closed_feed;
  MemorySink eof_sink;
  MemorySink closed_sink;
  for (auto *feed : {&eof_feed, &closed_feed}) {
    feed->PushLine("x");
    feed->PushLine("y");
  }
  eof_feed.PushError(core::EndOfStream());
  closed_feed.CloseLines();

  auto a = LineProcessor(log).Process(eof_feed, eof_sink);
  auto b = LineProcessor(log).Process(closed_feed, closed_sink);
  EXPECT_EQ(a.stats.lines, b.stats.lines);
  EXPECT_EQ(a.error.has_value(), b.error.has_value());
  EXPECT_EQ(eof_sink.content, closed_sink.content);
}

TEST(LineProcessor, ClosedErrorStreamDoesNotEndProcessing) {
  CaptureLogger log;
  LineFeed feed;
  MemorySink sink;

  std::jthread producer([&] {
    feed.CloseErrors();
    std::this_thread::sleep_for(10ms);
    feed.PushLine("late");
    feed.CloseLines();
  });
  auto result = LineProcessor(log).Process(feed, sink);
  EXPECT_TRUE(result.Ok());
  EXPECT_EQ(result.stats.lines, 1u);
  EXPECT_EQ(sink.content, "late\n");
}

TEST(LineProcessor, TransportErrorKeepsWrittenLines) {
  CaptureLogger log;
  LineFeed feed;
  MemorySink sink;
  feed.PushLine("kept");
  feed.PushError(core::Error{core::ErrorKind::transport, "read: reset"});
  feed.PushLine("never");

  auto result = LineProcessor(log).Process(feed, sink);
  ASSERT_TRUE(result.error);
  EXPECT_EQ(result.error->kind, core::ErrorKind::transport);
  EXPECT_EQ(result.stats.lines, 1u);
  EXPECT_EQ(sink.content, "kept\n");
}

TEST(LineProcessor, SinkFailureOnLineKReportsKMinusOne) {
  CaptureLogger log;
  LineFeed feed;
  MemorySink sink;
  sink.fail_at = 3;
  for (int i = 1; i <= 5; ++i) {
    feed.PushLine("l" + std::to_string(i));
  }
  feed.CloseLines();

  auto result = LineProcessor(log).Process(feed, sink);
  ASSERT_TRUE(result.error);
  EXPECT_EQ(result.error->kind, core::ErrorKind::io);
  EXPECT_EQ(result.stats.lines, 2u);
  EXPECT_EQ(sink.content, "l1\nl2\n");
  EXPECT_TRUE(log.Contains("Failed to write line 3"));
}

TEST(LineProcessor, DirectorySinkIsIoErrorWithNoLines) {
  TempDir dir;
  CaptureLogger log;
  LineFeed feed;
  feed.PushLine("unused");
  feed.CloseLines();

  auto result = LineProcessor(log).Process(feed, dir.Path().string());
  ASSERT_TRUE(result.error);
  EXPECT_EQ(result.error->kind, core::ErrorKind::io);
  EXPECT_EQ(result.stats.lines, 0u);
  EXPECT_TRUE(std::filesystem::is_directory(dir.Path()));
}

TEST(LineProcessor, ChannelEventsDriveTheSource) {
  CaptureLogger log;
  testing_support::FakeDataChannel channel("fileStream");
  MemorySink sink;
  channel.Open();
  channel.Deliver("one");
  channel.Deliver("two");
  channel.Close();

  streaming::ChannelLineSource source(channel);
  auto result = LineProcessor(log).Process(source, sink);
  EXPECT_TRUE(result.Ok());
  EXPECT_EQ(result.stats.lines, 2u);
  EXPECT_EQ(sink.content, "one\ntwo\n");
}

TEST(LineProcessor, ChannelFailureSurfacesTransportError) {
  CaptureLogger log;
  testing_support::FakeDataChannel channel("fileStream");
  MemorySink sink;
  channel.Deliver("one");
  channel.Fail(core::Error{core::ErrorKind::transport, "read: reset"});

  streaming::ChannelLineSource source(channel);
  auto result = LineProcessor(log).Process(source, sink);
  ASSERT_TRUE(result.error);
  EXPECT_EQ(result.error->message, "read: reset");
  EXPECT_EQ(result.stats.lines, 1u);
}

TEST(TransferStats, RateIsZeroForZeroElapsed) {
  streaming::TransferStats stats;
  stats.lines = 10;
  EXPECT_EQ(stats.LinesPerSecond(), 0.0);
  stats.elapsed = std::chrono::seconds(2);
  EXPECT_DOUBLE_EQ(stats.LinesPerSecond(), 5.0);
}
