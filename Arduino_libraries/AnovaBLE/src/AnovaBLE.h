/******************************************************************************************************/
// Include file for AnovaBLE library
//
// Client for the Anova Precision Cooker (A2/A3) over its BLE serial characteristic.
// One AnovaBLE instance talks to one cooker through a BleTransport supplied by the caller.
//
//   NimBLETransport transport;
//   transport.begin();
//   DeviceIdentity  id;
//   DeviceIdentity::fromAddress("01:02:03:04:05:06", "Kitchen", id);
//   AnovaBLE        cooker(transport, id);
//   cooker.connect();
//   cooker.setTemperature(56.5f);
//   cooker.start();
//   DeviceStatus s = cooker.getStatus();
//
// All calls block until the device answered or a timeout elapsed; none of them blocks forever.
// Temperatures are Celsius in both directions.
/******************************************************************************************************/

#ifndef ANOVA_BLE_H
#define ANOVA_BLE_H

#include <stdint.h>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "AnovaConfig.h"
#include "BleTransport.h"
#include "CommandSerializer.h"
#include "ConnectionManager.h"
#include "DeviceIdentity.h"
#include "ResponseAccumulator.h"
#include "StatusProtocol.h"
#include "logger.h"

/******************************************************************************************************/
/* Device Driver */
/******************************************************************************************************/

class AnovaBLE {
public:
  AnovaBLE(BleTransport& transport, const DeviceIdentity& identity, const AnovaConfig& config = AnovaConfig());
  ~AnovaBLE();
  AnovaBLE(const AnovaBLE&) = delete;
  AnovaBLE& operator=(const AnovaBLE&) = delete;

  // Connection
  bool            connect(int retries = CONNECT_ATTEMPTS, uint32_t timeoutMs = CONNECT_TIMEOUT_MS);
  void            disconnect();
  bool            isConnected() const { return connection.isConnected(); }
  ConnectionState connectionState() const { return connection.state(); }

  // Status
  DeviceStatus    getStatus();          // refresh, last known status if the cooker is unreachable
  DeviceStatus    status() const;       // last known status, no radio traffic
  bool            refreshStatus();      // one full refresh cycle, true if it was committed

  // Control, true once the cooker acknowledged
  bool            setTemperature(float celsius);
  bool            setTimer(int minutes);
  bool            start();
  bool            stop();
  bool            setUnit(TemperatureUnit unit);
  CommandOutcome  lastOutcome() const { return lastResult.load(); }

  // Discovery (does not need a connected instance)
  static std::vector<DeviceIdentity> discoverDevices(BleTransport& transport, uint32_t timeoutMs = DISCOVERY_TIMEOUT_MS);

  const DeviceIdentity& identity() const { return connection.identity(); }

  // Event hooks
  // Runs on the thread that completed the refresh; keep it short.
  void setOnStatusChanged(std::function<void(const DeviceStatus& status)> cb) { onStatusChanged = std::move(cb); }
  // Sleep used for retry backoff and command pacing, replaceable for tests
  void setDelayHook(std::function<void(uint32_t ms)> cb);

private:
  bool            sendWrite(const std::string& command);
  void            pause(uint32_t ms);

  AnovaConfig                 config;
  ResponseAccumulator         accumulator;
  ConnectionManager           connection;
  CommandSerializer           serializer;

  mutable std::mutex          statusMux;
  DeviceStatus                cached;
  std::atomic<CommandOutcome> lastResult{CommandOutcome::NoReply};

  std::function<void(const DeviceStatus&)> onStatusChanged;
  std::function<void(uint32_t)>            delayHook;
};

#endif // ANOVA_BLE_H
