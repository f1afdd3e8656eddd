// ****************************************************************************************************
// AnovaBLE Library
//
// Anova Precision Cooker client over BLE. Commands are written to the serial characteristic,
// replies are collected from its notifications and decoded into a cached DeviceStatus.
// ****************************************************************************************************
#include <chrono>
#include <cmath>
#include <thread>
#include "AnovaBLE.h"
#include "Discovery.h"

AnovaBLE::AnovaBLE(BleTransport& transport, const DeviceIdentity& identity, const AnovaConfig& cfg)
  : config(cfg),
    connection(transport, identity, cfg),
    serializer(connection, accumulator, cfg) {

  connection.setOnNotification([this](const uint8_t* data, size_t len) {
    accumulator.onNotification(data, len);
  });
  // a lost link ends the running exchange right away
  connection.setOnDisconnected([this]() {
    accumulator.abort();
  });
  connection.setOnConnected([this]() {
    if (!refreshStatus()) LOGW("Could not get initial status from %s", connection.identity().address.c_str());
  });
}

AnovaBLE::~AnovaBLE() {
  connection.disconnect();
}

void AnovaBLE::setDelayHook(std::function<void(uint32_t)> cb) {
  delayHook = cb;
  connection.setDelayHook(std::move(cb));
}

void AnovaBLE::pause(uint32_t ms) {
  if (ms == 0) return;
  if (delayHook) {
    delayHook(ms);
  } else {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
}

// ===== Connection ========================================================================

bool AnovaBLE::connect(int retries, uint32_t timeoutMs) {
  return connection.connect(retries, timeoutMs);
}

void AnovaBLE::disconnect() {
  connection.disconnect();
}

// ===== Status ============================================================================

DeviceStatus AnovaBLE::status() const {
  std::lock_guard<std::mutex> lock(statusMux);
  return cached;
}

DeviceStatus AnovaBLE::getStatus() {
  if (!connection.isConnected()) {
    LOGD("Not connected, attempting to reconnect");
    if (!connection.reconnect(config.reconnectTimeoutMs)) {
      LOGD("Cannot get status, returning cached status");
      return status();
    }
  }
  refreshStatus();
  return status();
}

bool AnovaBLE::refreshStatus() {
  DeviceStatus   working = status();
  const uint32_t epoch   = connection.epoch();
  bool           first   = true;

  for (StatusQuery q : StatusProtocol::REFRESH_SEQUENCE) {
    if (!first) pause(config.interCommandDelayMs);
    first = false;

    const std::optional<std::string> reply = serializer.execute(StatusProtocol::queryCommand(q), CommandClass::Status);
    if (!reply) {
      if (!connection.isConnected() || connection.epoch() != epoch) {
        LOGW("Status refresh abandoned, link lost");
        return false;
      }
      LOGD("No reply to %s query", StatusProtocol::queryName(q));
      continue;
    }

    if (StatusProtocol::apply(q, *reply, working) != CommandOutcome::Acknowledged) {
      #ifdef DEBUG
        char esc[64];
        LOGD("Ignoring %s reply \"%s\"", StatusProtocol::queryName(q), logEscape(esc, sizeof(esc), reply->data(), reply->size()));
      #endif
    }
  }

  // replies of a link that went down in between are not trusted
  if (connection.epoch() != epoch || !connection.isConnected()) return false;

  bool changed;
  {
    std::lock_guard<std::mutex> lock(statusMux);
    changed = (cached != working);
    cached  = working;
  }

  LOGD("Status: temp=%.1f target=%.1f timer=%d running=%d unit=%c",
       working.currentTemperature ? static_cast<double>(*working.currentTemperature) : NAN,
       working.targetTemperature  ? static_cast<double>(*working.targetTemperature)  : NAN,
       working.timerMinutes ? *working.timerMinutes : -1,
       working.running ? static_cast<int>(*working.running) : -1,
       working.unit ? static_cast<char>(*working.unit) : '?');

  if (changed && onStatusChanged) onStatusChanged(working);
  return true;
}

// ===== Control ===========================================================================

bool AnovaBLE::sendWrite(const std::string& command) {
  const CommandOutcome outcome = StatusProtocol::classifyAcknowledgement(
      serializer.execute(command, CommandClass::Acknowledge));
  lastResult = outcome;

  if (outcome != CommandOutcome::Acknowledged) {
    char esc[64];
    LOGW("Command \"%s\" failed: %s", logEscape(esc, sizeof(esc), command.data(), command.size()),
         StatusProtocol::outcomeName(outcome));
    return false;
  }

  // resynchronize the cached state; the command itself already succeeded
  refreshStatus();
  return true;
}

bool AnovaBLE::setTemperature(float celsius) {
  if (!std::isfinite(celsius) || celsius < TARGET_TEMP_MIN_C || celsius > TARGET_TEMP_MAX_C) {
    LOGW("Target temperature %.1f C outside %.0f..%.0f C", static_cast<double>(celsius),
         static_cast<double>(TARGET_TEMP_MIN_C), static_cast<double>(TARGET_TEMP_MAX_C));
    lastResult = CommandOutcome::Malformed;
    return false;
  }
  return sendWrite(StatusProtocol::encodeSetTemperature(celsius, status().unit));
}

bool AnovaBLE::setTimer(int minutes) {
  if (minutes < TIMER_MIN_MINUTES || minutes > TIMER_MAX_MINUTES) {
    LOGW("Timer %d min outside %d..%d min", minutes, TIMER_MIN_MINUTES, TIMER_MAX_MINUTES);
    lastResult = CommandOutcome::Malformed;
    return false;
  }
  return sendWrite(StatusProtocol::encodeSetTimer(minutes));
}

bool AnovaBLE::start() {
  return sendWrite(CMD_START);
}

bool AnovaBLE::stop() {
  return sendWrite(CMD_STOP);
}

bool AnovaBLE::setUnit(TemperatureUnit unit) {
  return sendWrite(StatusProtocol::encodeSetUnit(unit));
}

// ===== Discovery =========================================================================

std::vector<DeviceIdentity> AnovaBLE::discoverDevices(BleTransport& transport, uint32_t timeoutMs) {
  return Discovery::discoverDevices(transport, timeoutMs);
}
