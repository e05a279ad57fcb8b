#include "device/DryRunDevice.h"

#include <stdio.h>
#include <utility>

#include "utils/Log.h"

static const char* TAG = "device";

bool DryRunDevice::connect() {
  _connected = true;
  logf(LogLevel::INFO, TAG, "connected (%s)", name());
  return true;
}

void DryRunDevice::disconnect() {
  if (!_connected) return;
  _connected = false;
  logf(LogLevel::INFO, TAG, "disconnected after %lu motor writes",
       (unsigned long)_motor_writes);
}

void DryRunDevice::hex_(const uint8_t* data, size_t len, char* out, size_t out_size) {
  size_t pos = 0;
  out[0] = '\0';
  for (size_t i = 0; i < len && pos + 3 < out_size; i++) {
    pos += (size_t)snprintf(out + pos, out_size - pos, "%02X ", data[i]);
  }
}

bool DryRunDevice::writeMotor(const uint8_t* data, size_t len) {
  if (!_connected) return false;
  _motor_writes++;

  char hex[64];
  hex_(data, len, hex, sizeof(hex));
  logf(LogLevel::DEBUG, TAG, "motor <- %s", hex);
  return true;
}

bool DryRunDevice::writeConfig(const uint8_t* data, size_t len) {
  if (!_connected) return false;

  char hex[64];
  hex_(data, len, hex, sizeof(hex));
  logf(LogLevel::INFO, TAG, "config <- %s", hex);
  return true;
}

void DryRunDevice::onNotify(NotifyCallback cb) {
  std::lock_guard<std::mutex> lock(_cb_mutex);
  _notify = std::move(cb);
}

void DryRunDevice::injectNotification(const uint8_t* data, size_t len) {
  NotifyCallback cb;
  {
    std::lock_guard<std::mutex> lock(_cb_mutex);
    cb = _notify;
  }
  if (cb) cb(data, len);
}
