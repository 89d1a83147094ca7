#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>

#include "batch_types.hpp"
#include "collision_resolver.hpp"
#include "directory_scanner.hpp"
#include "rename_executor.hpp"
#include "run_context.hpp"
#include "sanitizer.hpp"

struct BatchOptions {
  ScanOptions scan;
  bool dry_run = false;
  bool backup = false;
  std::size_t workers = 0;        // 0 = hardware concurrency
  std::size_t max_in_flight = 0;  // 0 = 4 tasks per worker
};

// Drives one batch: scan, dispatch one task per file to a fixed-size pool,
// fold outcomes into a summary.
//
//   Idle -> ScanningDispatching -> Draining -> Completed
//                                            \-> Cancelled
//
// Cancellation stops new submissions; tasks already submitted still run and
// check the token themselves before touching the filesystem.
class BatchScheduler {
public:
  BatchScheduler(SanitizationPolicy policy, BatchOptions options, RunContext ctx);

  // Throws std::runtime_error when root is not an accessible directory; in
  // that case no task has run.
  BatchSummary run(const std::filesystem::path& root);

  // sanitize -> resolve -> execute for a single file.
  RenameOutcome process(const RenameTask& task);

  BatchState state() const { return state_.load(); }
  std::size_t worker_count() const { return workers_; }

private:
  RenameOutcome run_task(const RenameTask& task) noexcept;
  void fold(BatchSummary& summary, const RenameOutcome& outcome) const;

  Sanitizer sanitizer_;
  BatchOptions options_;
  RunContext ctx_;
  std::size_t workers_ = 1;
  std::shared_ptr<CollisionResolver> resolver_;
  RenameExecutor executor_;
  std::atomic<BatchState> state_{BatchState::Idle};
};
