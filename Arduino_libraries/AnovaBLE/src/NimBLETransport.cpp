// ****************************************************************************************************
// NimBLETransport
//
// Central side of the cooker link on NimBLE-Arduino 2.x.
// The cooker exposes one service (FFE0) with one characteristic (FFE1) that takes commands by
// write and answers by notification.
// ****************************************************************************************************
#include "NimBLETransport.h"
#include "AnovaConfig.h"
#include "DeviceIdentity.h"
#include "logger.h"

// ===== Client Callbacks ================================================================
class NimBLETransport::ClientCallbacks : public NimBLEClientCallbacks {
public:
  explicit ClientCallbacks(NimBLETransport* owner) : owner(owner) {}

  void onConnect(NimBLEClient* c) override {
    LOGD("Link up to %s", c->getPeerAddress().toString().c_str());
  }

  void onConnectFail(NimBLEClient* c, int reason) override {
    LOGD("Connect to %s failed, reason %d", c->getPeerAddress().toString().c_str(), reason);
  }

  void onDisconnect(NimBLEClient* c, int reason) override {
    if (!owner) return;
    auto& t = *owner;

    // only a link that was up counts as lost
    if (!t.linkUp.exchange(false)) return;
    LOGD("Link down from %s, reason %d", c->getPeerAddress().toString().c_str(), reason);

    DisconnectCallback cb;
    {
      std::lock_guard<std::mutex> lock(t.cbMux);
      cb = t.onDisconnect;
    }
    if (cb) cb(reason);
  }

private:
  NimBLETransport* owner;
}; // end of ClientCallbacks ============================================================

// ===== Lookup Callbacks: stops the scan once the wanted address shows up ===============
class NimBLETransport::LookupCallbacks : public NimBLEScanCallbacks {
public:
  explicit LookupCallbacks(const std::string& canonical) : target(canonical) {}

  void onResult(const NimBLEAdvertisedDevice* dev) override {
    std::string seen;
    if (found || !canonicalAddress(dev->getAddress().toString(), seen)) return;
    if (seen == target) {
      found = true;
      NimBLEDevice::getScan()->stop();
    }
  }

  std::atomic<bool> found{false};

private:
  std::string target;
}; // end of LookupCallbacks ============================================================

NimBLETransport::~NimBLETransport() {
  end();
}

bool NimBLETransport::begin(const char* localName, int8_t dBm) {
  if (started) return true;

  NimBLEDevice::init(localName);
  NimBLEDevice::setPower(dBm);

  client = NimBLEDevice::createClient();
  if (!client) {
    LOGE("Could not create BLE client");
    return false;
  }
  client->setClientCallbacks(new ClientCallbacks(this), true);

  NimBLEScan* scanner = NimBLEDevice::getScan();
  scanner->setActiveScan(true);   // names come with the scan response
  scanner->setInterval(ANOVA_SCAN_INTERVAL_MS);
  scanner->setWindow(ANOVA_SCAN_WINDOW_MS);

  started = true;
  LOGI("NimBLE central ready");
  return true;
}

void NimBLETransport::end() {
  if (!started) return;
  disconnect();
  if (client) {
    NimBLEDevice::deleteClient(client);
    client = nullptr;
  }
  NimBLEDevice::deinit(true);
  started = false;
}

// ===== Link ==============================================================================

bool NimBLETransport::connect(const std::string& address, uint32_t timeoutMs) {
  if (!started || !client) {
    LOGE("NimBLETransport::begin() was not called");
    return false;
  }
  if (client->isConnected()) {
    linkUp = true;
    return true;
  }

  client->setConnectTimeout(timeoutMs);
  const NimBLEAddress peer(address, BLE_ADDR_PUBLIC);
  if (!client->connect(peer)) {
    LOGD("connect(%s) returned false", address.c_str());
    return false;
  }

  linkUp = true;
  LOGD("Connected to %s, MTU %u, RSSI %d", address.c_str(), (unsigned)client->getMTU(), client->getRssi());
  return true;
}

void NimBLETransport::disconnect() {
  {
    std::lock_guard<std::mutex> lock(cbMux);
    onNotify = nullptr;
  }
  if (client && client->isConnected()) client->disconnect();
}

bool NimBLETransport::isConnected() const {
  return client && linkUp.load() && client->isConnected();
}

int NimBLETransport::rssi() const {
  return isConnected() ? client->getRssi() : 0;
}

// ===== GATT ==============================================================================

NimBLERemoteCharacteristic* NimBLETransport::characteristic(const char* uuid) {
  if (!isConnected()) return nullptr;
  NimBLERemoteService* svc = client->getService(NimBLEUUID(ANOVA_SERVICE_UUID));
  if (!svc) {
    LOGW("Service %s not found", ANOVA_SERVICE_UUID);
    return nullptr;
  }
  NimBLERemoteCharacteristic* chr = svc->getCharacteristic(NimBLEUUID(uuid));
  if (!chr) LOGW("Characteristic %s not found", uuid);
  return chr;
}

bool NimBLETransport::writeCharacteristic(const char* uuid, const uint8_t* data, size_t len, bool ack) {
  NimBLERemoteCharacteristic* chr = characteristic(uuid);
  if (!chr) return false;
  return chr->writeValue(data, len, ack);
}

bool NimBLETransport::subscribe(const char* uuid, NotifyCallback cb) {
  NimBLERemoteCharacteristic* chr = characteristic(uuid);
  if (!chr || !chr->canNotify()) return false;
  {
    std::lock_guard<std::mutex> lock(cbMux);
    onNotify = std::move(cb);
  }
  return chr->subscribe(true,
      [this](NimBLERemoteCharacteristic*, uint8_t* data, size_t len, bool) {
        NotifyCallback forward;
        {
          std::lock_guard<std::mutex> lock(cbMux);
          forward = onNotify;
        }
        if (forward) forward(data, len);
      },
      true);
}

bool NimBLETransport::unsubscribe(const char* uuid) {
  {
    std::lock_guard<std::mutex> lock(cbMux);
    onNotify = nullptr;
  }
  NimBLERemoteCharacteristic* chr = characteristic(uuid);
  if (!chr) return false;
  return chr->unsubscribe(true);
}

bool NimBLETransport::readCharacteristic(const char* uuid, std::string& out, uint32_t timeoutMs) {
  // the GATT read is bounded by the stack's own procedure timeout
  (void)timeoutMs;
  NimBLERemoteCharacteristic* chr = characteristic(uuid);
  if (!chr || !chr->canRead()) return false;
  const NimBLEAttValue value = chr->readValue();
  out.assign(reinterpret_cast<const char*>(value.data()), value.length());
  return isConnected();
}

// ===== Scanning ==========================================================================

std::vector<BlePeripheral> NimBLETransport::scan(uint32_t timeoutMs) {
  std::vector<BlePeripheral> seen;
  if (!started) return seen;

  NimBLEScan* scanner = NimBLEDevice::getScan();
  const NimBLEScanResults results = scanner->getResults(timeoutMs, false);

  for (int i = 0; i < results.getCount(); ++i) {
    const NimBLEAdvertisedDevice* dev = results.getDevice(i);
    if (!dev) continue;
    BlePeripheral p;
    p.address = dev->getAddress().toString();
    p.name    = dev->haveName() ? dev->getName() : std::string();
    p.rssi    = dev->getRSSI();
    for (uint8_t u = 0; u < dev->getServiceUUIDCount(); ++u) {
      p.serviceUuids.push_back(dev->getServiceUUID(u).toString());
    }
    seen.push_back(p);
  }
  scanner->clearResults();
  return seen;
}

bool NimBLETransport::lookup(const std::string& address, uint32_t timeoutMs) {
  std::string canonical;
  if (!started || !canonicalAddress(address, canonical)) return false;

  NimBLEScan*     scanner = NimBLEDevice::getScan();
  LookupCallbacks callbacks(canonical);
  scanner->setScanCallbacks(&callbacks, false);
  scanner->getResults(timeoutMs, false);   // returns early when onResult stops the scan
  scanner->setScanCallbacks(nullptr, false);
  scanner->clearResults();
  return callbacks.found.load();
}

void NimBLETransport::setOnDisconnect(DisconnectCallback cb) {
  std::lock_guard<std::mutex> lock(cbMux);
  onDisconnect = std::move(cb);
}
