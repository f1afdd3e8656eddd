/******************************************************************************************************/
// BleTransport
//
// Downward interface of the library: the BLE central primitives the cooker client needs.
// NimBLETransport implements it on ESP32, tests provide a scripted implementation.
//
// All calls are bounded by the timeout they take. Callbacks may run on any thread
// (NimBLE host task on ESP32); keep them short.
/******************************************************************************************************/

#ifndef BLE_TRANSPORT_H
#define BLE_TRANSPORT_H

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <string>
#include <vector>

// One advertising peripheral seen during a scan
struct BlePeripheral {
  std::string              address;
  std::string              name;
  std::vector<std::string> serviceUuids;
  int                      rssi = 0;
};

class BleTransport {
public:
  using NotifyCallback     = std::function<void(const uint8_t* data, size_t len)>;
  using DisconnectCallback = std::function<void(int reason)>;

  virtual ~BleTransport() = default;

  // Link
  virtual bool connect(const std::string& address, uint32_t timeoutMs) = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  // GATT
  virtual bool writeCharacteristic(const char* uuid, const uint8_t* data, size_t len, bool ack = true) = 0;
  virtual bool subscribe(const char* uuid, NotifyCallback cb) = 0;
  virtual bool unsubscribe(const char* uuid) = 0;
  virtual bool readCharacteristic(const char* uuid, std::string& out, uint32_t timeoutMs) = 0;

  // Scanning
  virtual std::vector<BlePeripheral> scan(uint32_t timeoutMs) = 0;
  // Directed search for one address; returns as soon as it is seen
  virtual bool lookup(const std::string& address, uint32_t timeoutMs) = 0;

  // Fired by the stack when an open link goes away, whoever closed it
  virtual void setOnDisconnect(DisconnectCallback cb) = 0;
};

#endif // BLE_TRANSPORT_H
