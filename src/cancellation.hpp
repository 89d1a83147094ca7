#pragma once

#include <atomic>

// Set once by whoever owns shutdown (signal watcher, tests); polled by the
// scanner between directories, by the scheduler before each submission and
// by each task before it touches the filesystem.
class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
  void reset() { cancelled_.store(false, std::memory_order_release); }

private:
  std::atomic<bool> cancelled_{false};
};
