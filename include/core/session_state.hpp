#pragma once

#include <string>

// Lifecycle of one interpreter environment:
//   uninitialized -> initializing -> ready <-> executing
//   initializing  -> uninitialized            (load failed, init may retry)
//   any live state -> terminated              (timeout or interrupt)
// terminated is absorbing; recovery means a brand-new Session.
enum class SessionState { uninitialized, initializing, ready, executing, terminated };

inline const char *ToString(SessionState s) {
  switch (s) {
  case SessionState::uninitialized:
    return "uninitialized";
  case SessionState::initializing:
    return "initializing";
  case SessionState::ready:
    return "ready";
  case SessionState::executing:
    return "executing";
  case SessionState::terminated:
    return "terminated";
  }
  return "unknown";
}

inline bool IsTransitionAllowed(SessionState from, SessionState to) {
  using S = SessionState;
  switch (to) {
  case S::initializing:
    return from == S::uninitialized;
  case S::ready:
    return from == S::initializing || from == S::executing;
  case S::uninitialized:
    return from == S::initializing;
  case S::executing:
    return from == S::ready;
  case S::terminated:
    return from != S::terminated;
  }
  return false;
}

struct TransitionError {
  SessionState from;
  SessionState to;

  std::string Message() const {
    return std::string("invalid session transition ") + ToString(from) +
           " -> " + ToString(to);
  }
};
