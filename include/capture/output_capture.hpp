#pragma once

#include "capture/captured_output.hpp"

namespace capture {

// ICaptureBuffer — the two append-only guest streams of one run.
// Implementations live next to the interpreter that writes into them; every
// call happens on that interpreter's guest thread.
//   Clear()   resets both streams (before every run, the first included)
//   Capture() starts redirecting guest writes into the buffer
//   Release() restores the guest's original streams
//   Read()    returns current contents without clearing
class ICaptureBuffer {
public:
  virtual ~ICaptureBuffer() = default;
  virtual void Clear() = 0;
  virtual void Capture() = 0;
  virtual void Release() = 0;
  virtual CapturedOutput Read() = 0;
};

// CaptureScope — pairs one Capture() with exactly one Release() on every exit
// path of a run, including a throwing guest job.
class CaptureScope {
public:
  explicit CaptureScope(ICaptureBuffer &buffer) : buffer_(buffer) {
    buffer_.Capture();
  }

  CaptureScope(const CaptureScope &) = delete;
  CaptureScope &operator=(const CaptureScope &) = delete;

  ~CaptureScope() { Release(); }

  void Release() {
    if (active_) {
      active_ = false;
      buffer_.Release();
    }
  }

private:
  ICaptureBuffer &buffer_;
  bool active_ = true;
};

} // namespace capture
