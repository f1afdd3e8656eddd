/******************************************************************************************************/
// FakeTransport
//
// Scripted BleTransport for the unit tests. Replies are delivered as notifications from inside
// writeCharacteristic(), the same thread that wrote the command, unless a test installs its own
// onWrite handler.
/******************************************************************************************************/

#ifndef FAKE_TRANSPORT_H
#define FAKE_TRANSPORT_H

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "AnovaConfig.h"
#include "BleTransport.h"

class FakeTransport : public BleTransport {
public:
  // ----- script -----
  std::map<std::string, std::vector<std::string>> replies;   // command -> notification fragments
  bool                       duplicateFragments = false;     // deliver every fragment twice
  std::string                readValue;                      // returned by readCharacteristic
  int                        failConnects       = 0;         // connect() fails this many times first
  bool                       subscribeOk        = true;
  bool                       lookupResult       = true;
  std::vector<BlePeripheral> peripherals;                    // returned by scan
  std::string                dropOnCommand;                  // link goes down after this write
  std::vector<std::string>   fragmentsBeforeDrop;            // delivered before the drop
  std::function<void(const std::string& command)> onWrite;   // replaces the scripted replies

  // ----- observations -----
  std::vector<uint32_t>      connectTimeouts;
  int                        scans       = 0;
  int                        lookups     = 0;
  int                        reads       = 0;
  int                        disconnects = 0;

  std::vector<std::string> writes() const {
    std::lock_guard<std::mutex> lock(mtx);
    return written;
  }

  // Deliver a notification as the stack would
  void notify(const std::string& fragment) {
    NotifyCallback cb;
    {
      std::lock_guard<std::mutex> lock(mtx);
      cb = notifyCb;
    }
    if (cb) cb(reinterpret_cast<const uint8_t*>(fragment.data()), fragment.size());
  }

  // Link goes away without being asked to
  void dropLink(int reason = 0x08) {
    DisconnectCallback cb;
    {
      std::lock_guard<std::mutex> lock(mtx);
      if (!connected) return;
      connected = false;
      notifyCb  = nullptr;
      cb        = disconnectCb;
    }
    if (cb) cb(reason);
  }

  // ----- BleTransport -----
  bool connect(const std::string&, uint32_t timeoutMs) override {
    std::lock_guard<std::mutex> lock(mtx);
    connectTimeouts.push_back(timeoutMs);
    if (failConnects > 0) {
      failConnects--;
      return false;
    }
    connected = true;
    return true;
  }

  void disconnect() override {
    disconnects++;
    dropLink(0x16);   // local close reports back through the callback, like the stack does
  }

  bool isConnected() const override {
    std::lock_guard<std::mutex> lock(mtx);
    return connected;
  }

  bool writeCharacteristic(const char*, const uint8_t* data, size_t len, bool) override {
    const std::string command(reinterpret_cast<const char*>(data), len);
    std::function<void(const std::string&)> handler;
    std::vector<std::string>                fragments;
    {
      std::lock_guard<std::mutex> lock(mtx);
      if (!connected) return false;
      written.push_back(command);
      handler = onWrite;
      auto it = replies.find(command);
      if (it != replies.end()) fragments = it->second;
    }

    if (!dropOnCommand.empty() && command == dropOnCommand) {
      for (const auto& f : fragmentsBeforeDrop) notify(f);
      dropLink();
      return true;
    }
    if (handler) {
      handler(command);
      return true;
    }
    for (const auto& f : fragments) {
      notify(f);
      if (duplicateFragments) notify(f);
    }
    return true;
  }

  bool subscribe(const char*, NotifyCallback cb) override {
    if (!subscribeOk) return false;
    std::lock_guard<std::mutex> lock(mtx);
    notifyCb = std::move(cb);
    return true;
  }

  bool unsubscribe(const char*) override {
    std::lock_guard<std::mutex> lock(mtx);
    notifyCb = nullptr;
    return true;
  }

  bool readCharacteristic(const char*, std::string& out, uint32_t) override {
    reads++;
    if (!isConnected()) return false;
    out = readValue;
    return true;
  }

  std::vector<BlePeripheral> scan(uint32_t) override {
    scans++;
    return peripherals;
  }

  bool lookup(const std::string&, uint32_t) override {
    lookups++;
    return lookupResult;
  }

  void setOnDisconnect(DisconnectCallback cb) override {
    std::lock_guard<std::mutex> lock(mtx);
    disconnectCb = std::move(cb);
  }

private:
  mutable std::mutex       mtx;
  bool                     connected = false;
  std::vector<std::string> written;
  NotifyCallback           notifyCb;
  DisconnectCallback       disconnectCb;
};

// Same behavior as the defaults with the waits scaled down to a few milliseconds
inline AnovaConfig fastConfig() {
  AnovaConfig cfg;
  cfg.commandTimeoutMs    = 150;
  cfg.directReadTimeoutMs = 20;
  cfg.interCommandDelayMs = 0;
  cfg.statusPolicy        = { 30, 15 };
  cfg.ackPolicy           = { 20, 10 };
  return cfg;
}

#endif // FAKE_TRANSPORT_H
