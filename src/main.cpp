/*
  cube_teleop (operator process)

  Purpose:
  Drive one toio cube from a joystick channel and record episodes.

  For now:
  - Channel: newline-delimited JSON on stdin, pong replies on stdout
  - Device: DryRunDevice (frames logged in hex). SIGUSR1 injects a collision
    notification so the collision path can be exercised without hardware.
  - Recording: dataset under argv[1] (default RECORDING_OUTPUT_DIR)

  Usage:
    cube_teleop [output_dir]
*/

#include <atomic>
#include <chrono>
#include <signal.h>
#include <stdio.h>
#include <string>
#include <thread>
#include <unistd.h>

#include "Params.h"

#include "comms/ChannelLink.h"
#include "comms/CubeMessages.h"
#include "comms/FdReader.h"
#include "control/ControlLoop.h"
#include "device/DryRunDevice.h"
#include "recording/EpisodeRecorder.h"
#include "utils/Log.h"


/*=============================================================================
  GLOBALS
=============================================================================*/

static std::atomic<bool> g_stop{false};
static std::atomic<bool> g_inject_collision{false};

static void onStopSignal(int) { g_stop.store(true); }
static void onCollisionSignal(int) { g_inject_collision.store(true); }

static const char* TAG = "main";


/*=============================================================================
  MAIN
=============================================================================*/

int main(int argc, char** argv) {
  if (argc > 2) {
    fprintf(stderr, "usage: %s [output_dir]\n", argv[0]);
    return 2;
  }

  setLogMinLevel((LogLevel)LOG_MIN_LEVEL);

  struct sigaction sa = {};
  sigemptyset(&sa.sa_mask);
  sa.sa_handler = onStopSignal;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  sa.sa_handler = onCollisionSignal;
  sigaction(SIGUSR1, &sa, nullptr);

  // Device
  DryRunDevice device;
  if (!device.connect()) {
    logf(LogLevel::ERROR, TAG, "could not connect to %s", device.name());
    return 1;
  }

  // Recording
  RecorderConfig rec_cfg;
  if (argc == 2) rec_cfg.output_dir = argv[1];
  EpisodeRecorder recorder(rec_cfg);

  // Control
  ControlLoop loop(device, RECORDING_ENABLED ? &recorder : nullptr);
  loop.begin();

  // Channel: stdin in, pong lines out on stdout
  ChannelLink link;
  link.setReplySink([](const std::string& line) {
    fwrite(line.data(), 1, line.size(), stdout);
    fflush(stdout);
  });
  FdReader reader(STDIN_FILENO, link);
  reader.start();

  // SIGUSR1 is forwarded to the device from this thread, not from the handler
  std::atomic<bool> injector_stop{false};
  std::thread injector([&device, &injector_stop]() {
    const uint8_t collision[] = {SENSOR_TYPE_MOTION, 0x01, 0x01, 0x00, 0x01, 0x00};
    while (!injector_stop.load()) {
      if (g_inject_collision.exchange(false)) {
        logf(LogLevel::INFO, TAG, "injecting collision");
        device.injectNotification(collision, sizeof(collision));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  });

  logf(LogLevel::INFO, TAG, "running (Ctrl-C to stop, SIGUSR1 = collision)");
  runControlLoop(loop, link, g_stop);

  injector_stop.store(true);
  injector.join();
  reader.stop();

  const bool lost = loop.deviceLost();
  if (lost) logf(LogLevel::ERROR, TAG, "exiting: connection to %s lost", device.name());
  return lost ? 1 : 0;
}
