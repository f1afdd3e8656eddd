/******************************************************************************************************/
// ResponseAccumulator
//
// The cooker answers with plain text, without terminator or length, spread over one or more
// notifications. Completion is inferred from silence:
//
//   fragment  fragment        fragment
//   |---------|---------------|-------------[silence window]--> complete
//   0                                    (and at least minimumWait after start)
//
// FragmentBuffer holds the decision logic and works on caller supplied timestamps (ms since the
// exchange started), ResponseAccumulator is the rendezvous between the notification callback and
// the thread waiting for the reply. Only one exchange is open at any time.
/******************************************************************************************************/

#ifndef RESPONSE_ACCUMULATOR_H
#define RESPONSE_ACCUMULATOR_H

#include <stdint.h>
#include <stddef.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include "AnovaConfig.h"

class FragmentBuffer {
public:
  void        reset();

  // Append a fragment received at nowMs.
  // Returns false if it was empty, an exact duplicate of an earlier fragment, or arrived after completion.
  bool        add(const std::string& fragment, uint32_t nowMs);

  // Returns true exactly once: on the call that declares the response complete
  bool        poll(const ResponsePolicy& policy, uint32_t nowMs);

  // Earliest time at which poll() can succeed, only meaningful with count() > 0
  uint32_t    readyAtMs(const ResponsePolicy& policy) const;

  // Stop accepting fragments (overall timeout)
  void        close() { completed = true; }

  bool        complete()      const { return completed; }
  size_t      count()         const { return fragments.size(); }
  uint32_t    lastArrivalMs() const { return lastArrival; }
  std::string text()          const;   // fragments joined in arrival order

private:
  std::vector<std::string> fragments;
  uint32_t                 lastArrival = 0;
  bool                     completed   = false;
};

enum class ExchangeResult {
  Complete,         // silence window elapsed after at least one fragment
  PartialTimeout,   // overall timeout, some fragments received
  NoFragments,      // overall timeout, nothing received
  Aborted           // link lost or no exchange open
};

const char* exchangeResultName(ExchangeResult r);

class ResponseAccumulator {
public:
  ResponseAccumulator() = default;
  ResponseAccumulator(const ResponseAccumulator&) = delete;
  ResponseAccumulator& operator=(const ResponseAccumulator&) = delete;

  // Open the single exchange slot for command; clears whatever a previous exchange left behind
  void           begin(const std::string& command);
  // Close the slot; fragments arriving afterwards are dropped
  void           end();

  // Notification entry point, safe to call from any thread
  void           onNotification(const uint8_t* data, size_t len);

  // Wake the waiter with Aborted (disconnection)
  void           abort();

  // Block until the response is complete, timeoutMs after begin(), or abort().
  // out receives the assembled, whitespace trimmed text for Complete and PartialTimeout.
  ExchangeResult wait(const ResponsePolicy& policy, uint32_t timeoutMs, std::string& out);

  bool           active()         const;
  uint32_t       staleDrops()     const;   // fragments that arrived with no open exchange
  uint32_t       duplicateDrops() const;

private:
  uint32_t       elapsedMs() const;        // since begin(), caller holds mtx

  mutable std::mutex                    mtx;
  std::condition_variable               cv;
  bool                                  open    = false;
  bool                                  aborted = false;
  std::string                           command;
  FragmentBuffer                        buffer;
  std::chrono::steady_clock::time_point startedAt;
  uint32_t                              stale      = 0;
  uint32_t                              duplicates = 0;
};

// Trims spaces, tabs, CR and LF at both ends
std::string trimReply(const std::string& text);

#endif // RESPONSE_ACCUMULATOR_H
