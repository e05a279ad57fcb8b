#include "comms/ChannelLink.h"
#include "comms/Protocol.h"
#include "utils/Log.h"

#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace protocol;

static void testDecodeMessages() {
  ChannelMessage msg;

  assert(decodeChannelLine("{\"type\":\"stick\",\"x\":0.25,\"y\":-1.0}", msg));
  assert(msg.valid && msg.type == ChannelMessageType::STICK);
  assert(std::fabs(msg.stick.x - 0.25f) < 1e-6f);
  assert(std::fabs(msg.stick.y + 1.0f) < 1e-6f);

  // Missing axes decode as centered
  assert(decodeChannelLine("{\"type\":\"stick\"}", msg));
  assert(msg.stick.x == 0.0f && msg.stick.y == 0.0f);

  assert(decodeChannelLine("{\"type\":\"estop\"}", msg));
  assert(msg.type == ChannelMessageType::ESTOP);

  assert(decodeChannelLine("{\"type\":\"recording\",\"command\":\"start\"}", msg));
  assert(msg.recording == RecordingCommand::START);
  assert(decodeChannelLine("{\"type\":\"recording\",\"command\":\"start_episode\"}", msg));
  assert(msg.recording == RecordingCommand::START);
  assert(decodeChannelLine("{\"type\":\"recording\",\"command\":\"end\"}", msg));
  assert(msg.recording == RecordingCommand::END);
  assert(decodeChannelLine("{\"type\":\"recording\",\"command\":\"stop\"}", msg));
  assert(msg.recording == RecordingCommand::END);
  assert(decodeChannelLine("{\"type\":\"recording\",\"command\":\"end_episode\"}", msg));
  assert(msg.recording == RecordingCommand::END);
  assert(!decodeChannelLine("{\"type\":\"recording\",\"command\":\"pause\"}", msg));

  assert(decodeChannelLine("{\"type\":\"ping\",\"ts\":12.5}", msg));
  assert(msg.type == ChannelMessageType::PING && msg.has_ts && msg.ts == 12.5);
  assert(decodeChannelLine("{\"type\":\"pong\"}", msg));
  assert(msg.type == ChannelMessageType::PONG && !msg.has_ts);
}

static void testDecodeRejectsGarbage() {
  ChannelMessage msg;
  assert(!decodeChannelLine("", msg));
  assert(!decodeChannelLine("not json", msg));
  assert(!decodeChannelLine("{\"type\":\"warp\"}", msg));
  assert(!decodeChannelLine("[1,2,3]", msg));
  assert(!decodeChannelLine("{\"x\":1}", msg));
  assert(!decodeChannelLine(nullptr, msg));
  assert(!msg.valid);
}

static void testPongLine() {
  std::string line;
  encodePongLine(3.5, line);
  assert(line == "{\"type\":\"pong\",\"ts\":3.5}\n");

  ChannelMessage msg;
  line.pop_back();
  assert(decodeChannelLine(line.c_str(), msg));
  assert(msg.type == ChannelMessageType::PONG && msg.ts == 3.5);
}

static void testLatestValueAndLiveness() {
  ChannelLink link;
  ChannelSnapshot s = link.takeSnapshot(0);
  assert(!s.alive);

  link.begin(1000);
  s = link.takeSnapshot(1000);
  assert(s.alive);

  link.feedLine("{\"type\":\"stick\",\"x\":0.1,\"y\":0.2}", 1100);
  link.feedLine("{\"type\":\"stick\",\"x\":0.3,\"y\":0.4}", 1200);
  s = link.takeSnapshot(1300);
  assert(std::fabs(s.stick.x - 0.3f) < 1e-6f && std::fabs(s.stick.y - 0.4f) < 1e-6f);
  assert(s.age_ms == 100);
  assert(s.alive);

  // Garbage does not refresh liveness
  link.feedLine("garbage", 3000);
  assert(link.alive(3199));
  assert(!link.alive(3200));

  // Latest stick survives reads
  s = link.takeSnapshot(3300);
  assert(!s.alive);
  assert(std::fabs(s.stick.x - 0.3f) < 1e-6f);

  link.close();
  link.feedLine("{\"type\":\"estop\"}", 3400);
  assert(!link.alive(3400));
}

static void testEstopAndRecordingConsumedOnce() {
  ChannelLink link;
  link.begin(0);

  link.feedLine("{\"type\":\"estop\"}", 10);
  link.feedLine("{\"type\":\"recording\",\"command\":\"start\"}", 10);
  ChannelSnapshot s = link.takeSnapshot(20);
  assert(s.estop);
  assert(s.recording == RecordingCommand::START);

  s = link.takeSnapshot(30);
  assert(!s.estop);
  assert(s.recording == RecordingCommand::NONE);

  // A stick message right after the e-stop does not release it; only the
  // snapshot consumes the latch
  link.feedLine("{\"type\":\"estop\",\"reason\":\"user\"}", 40);
  link.feedLine("{\"type\":\"stick\",\"x\":0,\"y\":0}", 41);
  s = link.takeSnapshot(50);
  assert(s.estop);
  assert(s.stick.x == 0.0f && s.stick.y == 0.0f);
  s = link.takeSnapshot(60);
  assert(!s.estop);
}

static void testFramingAndOverflow() {
  ChannelLink link;
  link.begin(0);

  // Split across feeds with CRLF
  const char* a = "{\"type\":\"sti";
  const char* b = "ck\",\"x\":1,\"y\":0}\r\n{\"type\":\"estop\"}\n";
  link.feed(a, strlen(a), 5);
  link.feed(b, strlen(b), 6);
  assert(link.rxOk() == 2);
  ChannelSnapshot s = link.takeSnapshot(7);
  assert(s.stick.x == 1.0f && s.estop);

  // Oversized line is dropped up to the newline, the next line decodes
  std::string big(CHANNEL_LINE_BUFFER_BYTES + 50, 'x');
  big += "\n{\"type\":\"stick\",\"x\":-1,\"y\":0}\n";
  link.feed(big.data(), big.size(), 8);
  assert(link.rxOverflow() == 1);
  s = link.takeSnapshot(9);
  assert(s.stick.x == -1.0f);
  assert(link.rxOk() == 3);

  // Empty lines are not failures
  link.feed("\n\n", 2, 10);
  assert(link.rxFail() == 0);
}

static void testPingReply() {
  ChannelLink link;
  std::vector<std::string> replies;
  link.setReplySink([&](const std::string& line) { replies.push_back(line); });
  link.begin(0);

  link.feedLine("{\"type\":\"ping\",\"ts\":1.0}", 5);
  assert(replies.size() == 1);

  ChannelMessage msg;
  std::string line = replies[0];
  assert(line.back() == '\n');
  line.pop_back();
  assert(decodeChannelLine(line.c_str(), msg));
  assert(msg.type == ChannelMessageType::PONG && msg.has_ts);

  link.feedLine("{\"type\":\"pong\",\"ts\":1.0}", 6);
  assert(replies.size() == 1);
}

int main() {
  setLogSink([](LogLevel, const char*) {});

  testDecodeMessages();
  testDecodeRejectsGarbage();
  testPongLine();
  testLatestValueAndLiveness();
  testEstopAndRecordingConsumedOnce();
  testFramingAndOverflow();
  testPingReply();

  std::cout << "All tests passed\n";
  return 0;
}
