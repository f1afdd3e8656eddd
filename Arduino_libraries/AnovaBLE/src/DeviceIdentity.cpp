#include <cctype>
#include "DeviceIdentity.h"
#include "AnovaConfig.h"
#include "logger.h"

static constexpr size_t ADDRESS_HEX_DIGITS = 12;

bool canonicalAddress(const std::string& raw, std::string& out) {
  std::string hex;
  hex.reserve(ADDRESS_HEX_DIGITS);

  for (char c : raw) {
    if (c == ':' || c == '-' || c == ' ' || c == '\t') continue;
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    if (hex.size() == ADDRESS_HEX_DIGITS) return false;   // too long
    hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (hex.size() != ADDRESS_HEX_DIGITS) return false;

  std::string canonical;
  canonical.reserve(17);
  for (size_t i = 0; i < ADDRESS_HEX_DIGITS; i += 2) {
    if (i) canonical.push_back(':');
    canonical.push_back(hex[i]);
    canonical.push_back(hex[i + 1]);
  }
  out = canonical;
  return true;
}

bool isPlaceholderAddress(const std::string& canonical) {
  return canonical == "AA:BB:CC:DD:EE:FF" || canonical == "00:00:00:00:00:00";
}

std::string fallbackDeviceName(const std::string& canonical) {
  const size_t n = canonical.size();
  return std::string(ANOVA_DEVICE_NAME_PREFIX) + " " + (n > 5 ? canonical.substr(n - 5) : canonical);
}

bool DeviceIdentity::fromAddress(const std::string& rawAddress, const std::string& name, DeviceIdentity& out) {
  std::string canonical;
  if (!canonicalAddress(rawAddress, canonical)) {
    LOGW("Invalid device address \"%s\", expected six hex octets", rawAddress.c_str());
    return false;
  }
  if (isPlaceholderAddress(canonical)) {
    LOGW("Placeholder address %s detected, use the actual address of your Anova device", canonical.c_str());
  }

  // trim the name, fall back to the product name
  size_t first = name.find_first_not_of(" \t\r\n");
  size_t last  = name.find_last_not_of(" \t\r\n");
  out.address = canonical;
  out.name    = (first == std::string::npos) ? std::string(ANOVA_DEFAULT_DEVICE_NAME)
                                             : name.substr(first, last - first + 1);
  return true;
}
