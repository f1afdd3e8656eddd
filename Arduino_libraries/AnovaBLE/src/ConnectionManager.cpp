#include <stdio.h>
#include <algorithm>
#include <chrono>
#include <thread>
#include "ConnectionManager.h"
#include "logger.h"

const char* connectionStateName(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    default:                            return "unknown";
  }
}

ConnectionManager::ConnectionManager(BleTransport& t, const DeviceIdentity& identity, const AnovaConfig& cfg)
  : transport(t), device(identity), config(cfg) {
  transport.setOnDisconnect([this](int reason) {
    char why[32];
    snprintf(why, sizeof(why), "reason %d", reason);
    linkLost(why);
  });
}

ConnectionManager::~ConnectionManager() {
  transport.setOnDisconnect(nullptr);
}

bool ConnectionManager::isConnected() const {
  return connState.load() == ConnectionState::Connected && transport.isConnected();
}

void ConnectionManager::pause(uint32_t ms) {
  if (delayHook) {
    delayHook(ms);
  } else {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
}

// ===== Connect ===========================================================================

bool ConnectionManager::connect(int maxAttempts, uint32_t timeoutMs) {
  bool ok;
  {
    std::lock_guard<std::mutex> lock(connectMux);
    if (isConnected()) return true;
    ok = connectAttempts(maxAttempts, timeoutMs);
  }
  // The hook issues commands itself, so it runs outside the connect lock.
  // Its outcome does not change the result of connect().
  if (ok && onConnected) onConnected();
  return ok;
}

bool ConnectionManager::reconnect(uint32_t timeoutMs) {
  std::lock_guard<std::mutex> lock(connectMux);
  if (isConnected()) return true;
  return connectAttempts(1, timeoutMs);
}

bool ConnectionManager::connectAttempts(int maxAttempts, uint32_t timeoutMs) {
  if (maxAttempts < 1) maxAttempts = 1;

  // DeviceIdentity is a plain struct and may not have come from fromAddress()
  std::string canonical;
  if (!canonicalAddress(device.address, canonical)) {
    LOGE("Invalid device address \"%s\", not connecting", device.address.c_str());
    connState = ConnectionState::Disconnected;
    return false;
  }

  for (int n = 1; n <= maxAttempts; ++n) {
    LOGI("Connecting to %s (attempt %d/%d)", device.address.c_str(), n, maxAttempts);
    connState = ConnectionState::Connecting;

    if (attempt(timeoutMs)) {
      std::lock_guard<std::mutex> lock(stateMux);
      // The link may have dropped between subscribing and here
      if (transport.isConnected()) {
        connState = ConnectionState::Connected;
        linkEpoch++;
        LOGI("Connected to %s%s", device.address.c_str(), notifying ? "" : " (no notifications)");
        return true;
      }
    }

    {
      std::lock_guard<std::mutex> lock(stateMux);
      connState = ConnectionState::Disconnected;
      notifying = false;
    }
    if (n < maxAttempts) {
      LOGW("Connection attempt %d/%d failed, retrying in %u ms", n, maxAttempts, (unsigned)config.connectBackoffMs);
      pause(config.connectBackoffMs);
    }
  }

  LOGE("Failed to connect to %s after %d attempts", device.address.c_str(), maxAttempts);
  return false;
}

bool ConnectionManager::attempt(uint32_t timeoutMs) {
  resolveDevice();

  // the stack does not complete a connection in less than the floor
  const uint32_t linkTimeoutMs = std::max(timeoutMs, config.connectTimeoutFloorMs);
  if (!transport.connect(device.address, linkTimeoutMs)) {
    LOGW("Link to %s not established within %u ms", device.address.c_str(), (unsigned)linkTimeoutMs);
    if (transport.isConnected()) transport.disconnect();   // half open
    return false;
  }
  if (!transport.isConnected()) return false;

  const bool subscribed = transport.subscribe(ANOVA_CHARACTERISTIC_UUID, [this](const uint8_t* data, size_t len) {
    if (onNotification) onNotification(data, len);
  });
  notifying = subscribed;
  if (!subscribed) {
    LOGW("Could not enable notifications, replies will be read directly");
  }

  return transport.isConnected();
}

void ConnectionManager::resolveDevice() {
  if (transport.lookup(device.address, config.lookupTimeoutMs)) return;

  LOGD("%s not seen by directed lookup, scanning", device.address.c_str());
  const std::vector<BlePeripheral> seen = transport.scan(config.fallbackScanTimeoutMs);
  for (const auto& p : seen) {
    std::string canonical;
    if (canonicalAddress(p.address, canonical) && canonical == device.address) return;
  }
  LOGW("Device %s not found in scan, trying direct connection anyway", device.address.c_str());
}

// ===== Disconnect ========================================================================

void ConnectionManager::disconnect() {
  std::lock_guard<std::mutex> lock(connectMux);

  const bool open = transport.isConnected();
  if (open && notifying && !transport.unsubscribe(ANOVA_CHARACTERISTIC_UUID)) {
    LOGD("Unsubscribe failed, closing link anyway");
  }

  // leave Connected first so the stack's disconnect callback finds nothing left to do
  bool wasConnected;
  {
    std::lock_guard<std::mutex> state(stateMux);
    wasConnected = (connState == ConnectionState::Connected);
    if (wasConnected) linkEpoch++;
    connState = ConnectionState::Disconnected;
    notifying = false;
  }
  if (open) transport.disconnect();

  if (wasConnected) {
    LOGI("Disconnected from %s", device.address.c_str());
    if (onDisconnected) onDisconnected();
  }
}

void ConnectionManager::linkLost(const char* why) {
  bool wasConnected;
  {
    std::lock_guard<std::mutex> lock(stateMux);
    wasConnected = (connState == ConnectionState::Connected);
    if (wasConnected) linkEpoch++;
    connState = ConnectionState::Disconnected;
    notifying = false;
  }
  if (wasConnected) {
    LOGW("Link to %s lost (%s)", device.address.c_str(), why);
    if (onDisconnected) onDisconnected();
  }
}

// ===== Characteristic access =============================================================

bool ConnectionManager::write(const std::string& payload) {
  if (!isConnected()) return false;

  const bool ok = transport.writeCharacteristic(ANOVA_CHARACTERISTIC_UUID,
                                                reinterpret_cast<const uint8_t*>(payload.data()),
                                                payload.size(), true);
  if (!transport.isConnected()) {
    linkLost("write");
    return false;
  }
  if (!ok) LOGW("Write to %s failed", device.address.c_str());
  return ok;
}

bool ConnectionManager::read(std::string& out, uint32_t timeoutMs) {
  if (!isConnected()) return false;

  const bool ok = transport.readCharacteristic(ANOVA_CHARACTERISTIC_UUID, out, timeoutMs);
  if (!transport.isConnected()) {
    linkLost("read");
    return false;
  }
  if (!ok) LOGD("Direct read from %s failed", device.address.c_str());
  return ok;
}
