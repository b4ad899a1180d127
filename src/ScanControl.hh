#pragma once

#include <stddef.h>

#include <atomic>
#include <functional>
#include <stdexcept>

namespace ToyBinDASM {

class ScanCancelled : public std::runtime_error {
public:
  ScanCancelled() : std::runtime_error("scan cancelled") {}
};

// Lets a host run a long scan on a worker thread: progress is reported as
// (items done, items total) and cancellation is checked between scan steps.
struct ScanControl {
  std::function<void(size_t done, size_t total)> on_progress;
  const std::atomic<bool>* cancel_flag = nullptr;
  size_t progress_interval = 0x10000;

  inline void step(size_t done, size_t total) const {
    if ((done % this->progress_interval) != 0) {
      return;
    }
    if (this->cancel_flag && this->cancel_flag->load()) {
      throw ScanCancelled();
    }
    if (this->on_progress) {
      this->on_progress(done, total);
    }
  }
};

} // namespace ToyBinDASM
