#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

/*
===============================================================================
  CubeDevice.h
===============================================================================

  PURPOSE
  -------
  Session with one cube. The BLE transport (scan, connect, GATT) lives behind
  this interface; the control loop only sees frames.

  Responsibilities of an implementation:
    - connect(): find and connect, enable sensor notifications
    - writeMotor(): write-without-response to the motor characteristic
    - writeConfig(): write to the configuration characteristic
    - onNotify(): deliver every sensor notification to the callback, possibly
      from the transport's own thread
    - disconnect(): idempotent

  Writes are fire-and-forget. A false return means the frame was not handed
  to the transport (not connected, transport error).
===============================================================================
*/

class CubeDevice {
public:
  using NotifyCallback = std::function<void(const uint8_t* data, size_t len)>;

  virtual ~CubeDevice() = default;

  virtual bool connect() = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  virtual bool writeMotor(const uint8_t* data, size_t len) = 0;
  virtual bool writeConfig(const uint8_t* data, size_t len) = 0;

  virtual void onNotify(NotifyCallback cb) = 0;

  // Human readable identity for logs (address, "dry-run", ...)
  virtual const char* name() const = 0;
};
