#include <algorithm>
#include "ResponseAccumulator.h"
#include "logger.h"

// ===== FragmentBuffer ================================================================

void FragmentBuffer::reset() {
  fragments.clear();
  lastArrival = 0;
  completed   = false;
}

bool FragmentBuffer::add(const std::string& fragment, uint32_t nowMs) {
  if (completed || fragment.empty()) return false;
  // the notify layer may deliver the same payload twice
  if (std::find(fragments.begin(), fragments.end(), fragment) != fragments.end()) return false;

  fragments.push_back(fragment);
  lastArrival = nowMs;
  return true;
}

uint32_t FragmentBuffer::readyAtMs(const ResponsePolicy& policy) const {
  return std::max(lastArrival + policy.silenceWindowMs, policy.minimumWaitMs);
}

bool FragmentBuffer::poll(const ResponsePolicy& policy, uint32_t nowMs) {
  if (completed || fragments.empty()) return false;
  if (nowMs < readyAtMs(policy)) return false;
  completed = true;
  return true;
}

std::string FragmentBuffer::text() const {
  std::string joined;
  for (const auto& f : fragments) joined += f;
  return joined;
}

// ===== Helpers =======================================================================

std::string trimReply(const std::string& text) {
  static constexpr const char* WS = " \t\r\n";
  const size_t first = text.find_first_not_of(WS);
  if (first == std::string::npos) return std::string();
  const size_t last = text.find_last_not_of(WS);
  return text.substr(first, last - first + 1);
}

const char* exchangeResultName(ExchangeResult r) {
  switch (r) {
    case ExchangeResult::Complete:       return "complete";
    case ExchangeResult::PartialTimeout: return "partial timeout";
    case ExchangeResult::NoFragments:    return "no fragments";
    case ExchangeResult::Aborted:        return "aborted";
    default:                             return "unknown";
  }
}

// ===== ResponseAccumulator ===========================================================

uint32_t ResponseAccumulator::elapsedMs() const {
  using namespace std::chrono;
  return static_cast<uint32_t>(duration_cast<milliseconds>(steady_clock::now() - startedAt).count());
}

void ResponseAccumulator::begin(const std::string& cmd) {
  std::lock_guard<std::mutex> lock(mtx);
  buffer.reset();
  command   = cmd;
  aborted   = false;
  open      = true;
  startedAt = std::chrono::steady_clock::now();
}

void ResponseAccumulator::end() {
  std::lock_guard<std::mutex> lock(mtx);
  buffer.reset();
  command.clear();
  open    = false;
  aborted = false;
}

void ResponseAccumulator::onNotification(const uint8_t* data, size_t len) {
  if (!data || len == 0) return;
  std::string fragment(reinterpret_cast<const char*>(data), len);

  {
    std::lock_guard<std::mutex> lock(mtx);
    if (open && !aborted) {
      if (buffer.add(fragment, elapsedMs())) {
        cv.notify_all();
      } else if (!buffer.complete()) {
        duplicates++;
      }
      return;
    }
    stale++;
  }

  #ifdef DEBUG
    char esc[64];
    LOGD("Dropping fragment without open exchange: %s", logEscape(esc, sizeof(esc), fragment.data(), fragment.size()));
  #endif
}

void ResponseAccumulator::abort() {
  std::lock_guard<std::mutex> lock(mtx);
  if (!open) return;
  aborted = true;
  cv.notify_all();
}

ExchangeResult ResponseAccumulator::wait(const ResponsePolicy& policy, uint32_t timeoutMs, std::string& out) {
  std::unique_lock<std::mutex> lock(mtx);
  if (!open) return ExchangeResult::Aborted;

  while (true) {
    if (aborted) return ExchangeResult::Aborted;

    const uint32_t now = elapsedMs();
    if (buffer.poll(policy, now)) {
      out = trimReply(buffer.text());
      return ExchangeResult::Complete;
    }
    if (now >= timeoutMs) {
      if (buffer.count() == 0) {
        #ifdef DEBUG
          char esc[64];
          LOGD("Nothing notified for \"%s\" within %u ms", logEscape(esc, sizeof(esc), command.data(), command.size()), (unsigned)timeoutMs);
        #endif
        return ExchangeResult::NoFragments;
      }
      buffer.close();
      out = trimReply(buffer.text());
      return ExchangeResult::PartialTimeout;
    }

    uint32_t wakeAt = timeoutMs;
    if (buffer.count() > 0) wakeAt = std::min(wakeAt, buffer.readyAtMs(policy));
    cv.wait_for(lock, std::chrono::milliseconds(wakeAt > now ? wakeAt - now : 1));
  }
}

bool ResponseAccumulator::active() const {
  std::lock_guard<std::mutex> lock(mtx);
  return open;
}

uint32_t ResponseAccumulator::staleDrops() const {
  std::lock_guard<std::mutex> lock(mtx);
  return stale;
}

uint32_t ResponseAccumulator::duplicateDrops() const {
  std::lock_guard<std::mutex> lock(mtx);
  return duplicates;
}
