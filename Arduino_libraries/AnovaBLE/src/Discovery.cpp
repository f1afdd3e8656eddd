#include <cctype>
#include "Discovery.h"
#include "AnovaConfig.h"
#include "logger.h"

namespace
{
  // 0000xxxx-0000-1000-8000-00805f9b34fb
  std::string expandUuid(const std::string& uuid) {
    std::string s;
    for (char c : uuid) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s.size() > 2 && s[0] == '0' && s[1] == 'x') s.erase(0, 2);
    if (s.size() == 4) return "0000" + s + "-0000-1000-8000-00805f9b34fb";
    if (s.size() == 8) return s + "-0000-1000-8000-00805f9b34fb";
    return s;
  }

  bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty() || haystack.size() < needle.size()) return false;
    for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
      size_t j = 0;
      while (j < needle.size() &&
             std::tolower(static_cast<unsigned char>(haystack[i + j])) ==
             std::tolower(static_cast<unsigned char>(needle[j]))) {
        j++;
      }
      if (j == needle.size()) return true;
    }
    return false;
  }
} // namespace

namespace Discovery
{
  bool sameUuid(const std::string& a, const std::string& b) {
    return !a.empty() && expandUuid(a) == expandUuid(b);
  }

  bool isCandidate(const BlePeripheral& p) {
    if (containsIgnoreCase(p.name, ANOVA_DEVICE_NAME_PREFIX)) return true;
    for (const auto& uuid : p.serviceUuids) {
      if (sameUuid(uuid, ANOVA_SERVICE_UUID)) return true;
    }
    return false;
  }

  std::vector<DeviceIdentity> filterCandidates(const std::vector<BlePeripheral>& peripherals) {
    std::vector<DeviceIdentity> found;
    for (const auto& p : peripherals) {
      if (!isCandidate(p)) {
        LOGD("Scanned device: %s (%s)", p.name.empty() ? "Unknown" : p.name.c_str(), p.address.c_str());
        continue;
      }
      std::string canonical;
      if (!canonicalAddress(p.address, canonical)) {
        LOGD("Skipping candidate with unusable address \"%s\"", p.address.c_str());
        continue;
      }
      bool duplicate = false;
      for (const auto& d : found) duplicate = duplicate || (d.address == canonical);
      if (duplicate) continue;

      DeviceIdentity id;
      id.address = canonical;
      id.name    = p.name.empty() ? fallbackDeviceName(canonical) : p.name;
      LOGI("Found Anova device: %s (%s), RSSI %d dBm", id.name.c_str(), id.address.c_str(), p.rssi);
      found.push_back(id);
    }
    return found;
  }

  std::vector<DeviceIdentity> discoverDevices(BleTransport& transport, uint32_t timeoutMs) {
    LOGI("Starting BLE scan for Anova devices (timeout: %u ms)", (unsigned)timeoutMs);
    const std::vector<BlePeripheral> seen = transport.scan(timeoutMs);
    if (seen.empty()) {
      LOGW("No BLE devices found during scan");
      return {};
    }
    std::vector<DeviceIdentity> found = filterCandidates(seen);
    LOGI("Found %u Anova device(s) out of %u total devices", (unsigned)found.size(), (unsigned)seen.size());
    return found;
  }

} // namespace Discovery
