/******************************************************************************************************/
// ConnectionManager
//
// Owns the link to one cooker: connect with retries, reconnect on demand, disconnect, and the
// Disconnected/Connecting/Connected state. The transport's disconnect callback is the only
// asynchronous transition and always wins, even while an exchange is running.
//
// The link epoch changes on every transition into or out of Connected. An exchange remembers
// the epoch it started in; a different epoch at the end means the link was lost in between.
/******************************************************************************************************/

#ifndef CONNECTION_MANAGER_H
#define CONNECTION_MANAGER_H

#include <stdint.h>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "AnovaConfig.h"
#include "BleTransport.h"
#include "DeviceIdentity.h"

enum class ConnectionState {
  Disconnected,
  Connecting,
  Connected
};

const char* connectionStateName(ConnectionState s);

class ConnectionManager {
public:
  ConnectionManager(BleTransport& transport, const DeviceIdentity& identity, const AnovaConfig& config);
  ~ConnectionManager();
  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Up to maxAttempts attempts with a fixed backoff in between, then the post-connect hook
  bool            connect(int maxAttempts, uint32_t timeoutMs);
  // One attempt, no post-connect hook
  bool            reconnect(uint32_t timeoutMs);
  void            disconnect();

  // State says Connected and the transport agrees
  bool            isConnected() const;
  ConnectionState state() const { return connState.load(); }
  uint32_t        epoch() const { return linkEpoch.load(); }
  bool            notificationsEnabled() const { return notifying.load(); }

  // Characteristic access, the link is re-verified after each call
  bool            write(const std::string& payload);
  bool            read(std::string& out, uint32_t timeoutMs);

  // Event hooks
  void setOnConnected(std::function<void()> cb)                          { onConnected = std::move(cb); }
  void setOnDisconnected(std::function<void()> cb)                       { onDisconnected = std::move(cb); }
  void setOnNotification(std::function<void(const uint8_t*, size_t)> cb) { onNotification = std::move(cb); }
  // Sleep used for the backoff, replaceable for tests
  void setDelayHook(std::function<void(uint32_t ms)> cb)                 { delayHook = std::move(cb); }

  const DeviceIdentity& identity() const { return device; }

private:
  bool            connectAttempts(int maxAttempts, uint32_t timeoutMs);
  bool            attempt(uint32_t timeoutMs);
  void            resolveDevice();
  void            linkLost(const char* why);
  void            pause(uint32_t ms);

  BleTransport&          transport;
  DeviceIdentity         device;
  AnovaConfig            config;

  std::mutex             connectMux;        // one connect/disconnect at a time
  std::mutex             stateMux;          // state + epoch transitions
  std::atomic<ConnectionState> connState{ConnectionState::Disconnected};
  std::atomic<uint32_t>  linkEpoch{0};
  std::atomic<bool>      notifying{false};

  std::function<void()>                         onConnected;
  std::function<void()>                         onDisconnected;
  std::function<void(const uint8_t*, size_t)>   onNotification;
  std::function<void(uint32_t)>                 delayHook;
};

#endif // CONNECTION_MANAGER_H
