#include <stdio.h>
#include <stdlib.h>
#include <cctype>
#include <cmath>
#include "StatusProtocol.h"
#include "AnovaConfig.h"

namespace
{
  std::string lowerCase(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
  }
} // namespace

namespace StatusProtocol
{
  const char* queryCommand(StatusQuery q) {
    switch (q) {
      case StatusQuery::Unit:               return CMD_READ_UNIT;
      case StatusQuery::RunState:           return CMD_GET_STATUS;
      case StatusQuery::TargetTemperature:  return CMD_READ_TARGET_TEMP;
      case StatusQuery::CurrentTemperature: return CMD_READ_CURRENT_TEMP;
      default:                              return CMD_GET_STATUS;
    }
  }

  const char* queryName(StatusQuery q) {
    switch (q) {
      case StatusQuery::Unit:               return "unit";
      case StatusQuery::RunState:           return "run state";
      case StatusQuery::TargetTemperature:  return "target temperature";
      case StatusQuery::CurrentTemperature: return "current temperature";
      default:                              return "unknown";
    }
  }

  const char* outcomeName(CommandOutcome o) {
    switch (o) {
      case CommandOutcome::Acknowledged: return "acknowledged";
      case CommandOutcome::NoReply:      return "no reply";
      case CommandOutcome::Malformed:    return "malformed";
      default:                           return "unknown";
    }
  }

  // ======================= ENCODE =======================

  std::string encodeSetTemperature(float celsius, std::optional<TemperatureUnit> deviceUnit) {
    const float value = (deviceUnit == TemperatureUnit::Fahrenheit) ? toFahrenheit(celsius) : celsius;
    char buf[48];
    snprintf(buf, sizeof(buf), "%s%.1f%s", CMD_SET_TEMP, static_cast<double>(value), CMD_TERMINATOR);
    return std::string(buf);
  }

  std::string encodeSetTimer(int minutes) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%s%d%s", CMD_SET_TIMER, minutes, CMD_TERMINATOR);
    return std::string(buf);
  }

  std::string encodeSetUnit(TemperatureUnit unit) {
    return (unit == TemperatureUnit::Fahrenheit) ? CMD_UNITS_F : CMD_UNITS_C;
  }

  // ======================= DECODE =======================

  std::optional<bool> decodeRunState(const std::string& reply) {
    const std::string s = lowerCase(reply);
    if (s.find("running") != std::string::npos) return true;
    if (s.find("stopped") != std::string::npos) return false;
    return std::nullopt;   // ambiguous, not an error
  }

  TemperatureUnit decodeUnit(const std::string& reply) {
    return (lowerCase(reply).find('f') != std::string::npos) ? TemperatureUnit::Fahrenheit
                                                           : TemperatureUnit::Celsius;
  }

  std::optional<float> decodeTemperature(const std::string& reply, std::optional<TemperatureUnit> knownUnit) {
    std::string number;
    for (char c : reply) {
      if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-') number.push_back(c);
    }
    if (number.empty()) return std::nullopt;

    char* end = nullptr;
    const float v = strtof(number.c_str(), &end);
    if (end == number.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;  // "1.2.3", "-"

    return (knownUnit == TemperatureUnit::Fahrenheit) ? toCelsius(v) : v;
  }

  std::optional<int> decodeTimer(const std::string& reply) {
    const std::string s = lowerCase(reply);
    size_t pos = s.find("timer");
    if (pos == std::string::npos) return std::nullopt;
    pos += 5;
    while (pos < s.size() && (s[pos] == ':' || std::isspace(static_cast<unsigned char>(s[pos])))) pos++;

    int  minutes = 0;
    bool digits  = false;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      if (minutes > 100000) return std::nullopt;   // not a timer
      minutes = minutes * 10 + (s[pos] - '0');
      digits  = true;
      pos++;
    }
    if (!digits) return std::nullopt;
    return minutes;
  }

  CommandOutcome apply(StatusQuery q, const std::string& reply, DeviceStatus& status) {
    switch (q) {
      case StatusQuery::Unit:
        status.unit = decodeUnit(reply);
        return CommandOutcome::Acknowledged;

      case StatusQuery::RunState: {
        const std::optional<int> timer = decodeTimer(reply);
        if (timer) status.timerMinutes = timer;
        const std::optional<bool> running = decodeRunState(reply);
        if (!running) return CommandOutcome::Malformed;
        status.running = running;
        return CommandOutcome::Acknowledged;
      }

      case StatusQuery::TargetTemperature:
      case StatusQuery::CurrentTemperature: {
        const std::optional<float> t = decodeTemperature(reply, status.unit);
        if (!t) return CommandOutcome::Malformed;
        if (q == StatusQuery::TargetTemperature) status.targetTemperature = t;
        else                                     status.currentTemperature = t;
        return CommandOutcome::Acknowledged;
      }

      default:
        return CommandOutcome::Malformed;
    }
  }

  CommandOutcome classifyAcknowledgement(const std::optional<std::string>& reply) {
    if (!reply || reply->empty()) return CommandOutcome::NoReply;
    for (char c : *reply) {
      const unsigned char u = static_cast<unsigned char>(c);
      if (u >= 0x80 || std::isgraph(u)) return CommandOutcome::Acknowledged;
    }
    return CommandOutcome::Malformed;
  }

} // namespace StatusProtocol
