#include "comms/FdReader.h"

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

#include "comms/ChannelLink.h"
#include "utils/Clock.h"
#include "utils/Log.h"

static const char* TAG = "channel";

FdReader::FdReader(int fd, ChannelLink& link, uint32_t poll_ms)
: _fd(fd),
  _link(link),
  _poll_ms(poll_ms == 0 ? 1 : poll_ms)
{
}

FdReader::~FdReader() {
  stop();
}

void FdReader::start() {
  if (_thread.joinable()) return;
  _stop = false;
  _running = true;
  _link.begin(millis());
  _thread = std::thread(&FdReader::run_, this);
}

void FdReader::stop() {
  _stop = true;
  if (_thread.joinable()) _thread.join();
  _running = false;
}

void FdReader::run_() {
  char buf[256];

  while (!_stop.load()) {
    struct pollfd pfd;
    pfd.fd = _fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    const int rc = poll(&pfd, 1, (int)_poll_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      logf(LogLevel::ERROR, TAG, "poll failed: %s", strerror(errno));
      break;
    }
    if (rc == 0) continue;

    const ssize_t n = read(_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      logf(LogLevel::ERROR, TAG, "read failed: %s", strerror(errno));
      break;
    }
    if (n == 0) {
      logf(LogLevel::INFO, TAG, "EOF on channel input");
      break;
    }

    _link.feed(buf, (size_t)n, millis());
  }

  _link.close();
  _running = false;
}
