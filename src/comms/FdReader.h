#pragma once

#include <atomic>
#include <cstdint>
#include <thread>

class ChannelLink;

/*
  FdReader

  Purpose:
  - Receive task for the channel: reads a POSIX file descriptor (stdin, a
    FIFO, a pty) on its own thread and feeds the bytes to a ChannelLink
  - Marks the link closed on EOF or read error

  The control loop never waits on this thread. stop() returns within one
  poll interval.
*/

class FdReader {
public:
  FdReader(int fd, ChannelLink& link, uint32_t poll_ms = 100);
  ~FdReader();

  FdReader(const FdReader&) = delete;
  FdReader& operator=(const FdReader&) = delete;

  void start();
  void stop();

  bool running() const { return _running.load(); }

private:
  void run_();

  int _fd;
  ChannelLink& _link;
  uint32_t _poll_ms;

  std::atomic<bool> _stop{false};
  std::atomic<bool> _running{false};
  std::thread _thread;
};
