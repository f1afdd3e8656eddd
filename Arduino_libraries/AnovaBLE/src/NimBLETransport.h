/******************************************************************************************************/
// NimBLETransport
//
// BleTransport on top of NimBLE-Arduino (2.x), central role. One client, one peer at a time.
// Notification and disconnect callbacks run in the NimBLE host task.
/******************************************************************************************************/

#ifndef NIMBLE_TRANSPORT_H
#define NIMBLE_TRANSPORT_H

#include <stdint.h>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include <Arduino.h>
#include <NimBLEDevice.h>

#include "BleTransport.h"

// dBm level for scanning and the connection
#define ANOVA_TX_DBP9  (9)

inline constexpr uint16_t ANOVA_SCAN_INTERVAL_MS = 100;
inline constexpr uint16_t ANOVA_SCAN_WINDOW_MS   =  99;   // nearly continuous

class NimBLETransport : public BleTransport {
public:
  NimBLETransport() = default;
  ~NimBLETransport() override;

  // init stack, create client; must run once before anything else
  bool begin(const char* localName = "AnovaBLE", int8_t dBm = ANOVA_TX_DBP9);
  void end();

  bool connect(const std::string& address, uint32_t timeoutMs) override;
  void disconnect() override;
  bool isConnected() const override;

  bool writeCharacteristic(const char* uuid, const uint8_t* data, size_t len, bool ack = true) override;
  bool subscribe(const char* uuid, NotifyCallback cb) override;
  bool unsubscribe(const char* uuid) override;
  bool readCharacteristic(const char* uuid, std::string& out, uint32_t timeoutMs) override;

  std::vector<BlePeripheral> scan(uint32_t timeoutMs) override;
  bool lookup(const std::string& address, uint32_t timeoutMs) override;

  void setOnDisconnect(DisconnectCallback cb) override;

  int  rssi() const;

private:
  class ClientCallbacks;
  class LookupCallbacks;
  friend class ClientCallbacks;
  friend class LookupCallbacks;

  NimBLERemoteCharacteristic* characteristic(const char* uuid);

  NimBLEClient*         client   = nullptr;
  bool                  started  = false;
  std::atomic<bool>     linkUp{false};

  std::mutex            cbMux;
  DisconnectCallback    onDisconnect;
  NotifyCallback        onNotify;
};

#endif // NIMBLE_TRANSPORT_H
