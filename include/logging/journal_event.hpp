#pragma once

#include <boost/lockfree/spsc_queue.hpp>
#include <cstdint>

namespace logging {

enum class JournalRequest : std::uint8_t { init, run, install, interrupt };
enum class JournalOutcome : std::uint8_t {
  ready,
  success,
  error,
  interrupted
};

inline const char *ToString(JournalRequest r) {
  switch (r) {
  case JournalRequest::init:
    return "init";
  case JournalRequest::run:
    return "run";
  case JournalRequest::install:
    return "install";
  case JournalRequest::interrupt:
    return "interrupt";
  }
  return "unknown";
}

inline const char *ToString(JournalOutcome o) {
  switch (o) {
  case JournalOutcome::ready:
    return "ready";
  case JournalOutcome::success:
    return "success";
  case JournalOutcome::error:
    return "error";
  case JournalOutcome::interrupted:
    return "interrupted";
  }
  return "unknown";
}

// One finished request. Trivially copyable so it fits the SPSC ring.
struct JournalEvent {
  std::int64_t epoch_ms;
  std::uint64_t session_id;
  std::uint32_t controller;
  JournalRequest request;
  JournalOutcome outcome;
  std::int64_t execution_us; // -1 when the request had no timed run
};

inline constexpr std::size_t kJournalRingCapacity = 1u << 12;

// Single producer: the reactor thread. Single consumer: JournalLogger.
using JournalQueue = boost::lockfree::spsc_queue<
    JournalEvent, boost::lockfree::capacity<kJournalRingCapacity>>;

} // namespace logging
