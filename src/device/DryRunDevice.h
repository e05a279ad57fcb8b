#pragma once

#include <cstdint>
#include <mutex>

#include "device/CubeDevice.h"

/*
  DryRunDevice

  Purpose:
  - Stand-in cube for running the operator without hardware
  - Logs every motor/config frame in hex (DEBUG for motor, INFO for config)
  - injectNotification() feeds a sensor frame through the notify callback,
    the same path a BLE transport uses
*/

class DryRunDevice : public CubeDevice {
public:
  DryRunDevice() = default;

  bool connect() override;
  void disconnect() override;
  bool isConnected() const override { return _connected; }

  bool writeMotor(const uint8_t* data, size_t len) override;
  bool writeConfig(const uint8_t* data, size_t len) override;

  void onNotify(NotifyCallback cb) override;

  const char* name() const override { return "dry-run"; }

  // Simulate a notification from the cube's sensor characteristic
  void injectNotification(const uint8_t* data, size_t len);

  uint32_t motorWrites() const { return _motor_writes; }

private:
  static void hex_(const uint8_t* data, size_t len, char* out, size_t out_size);

  bool _connected = false;
  uint32_t _motor_writes = 0;

  std::mutex _cb_mutex;
  NotifyCallback _notify;
};
