#pragma once

#include <filesystem>

#include "batch_types.hpp"

// Receives the per-file event stream and the final summary. All callbacks are
// invoked from the thread that runs the batch, never from pool workers.
class BatchReporter {
public:
  virtual ~BatchReporter() = default;

  virtual void on_batch_start(const std::filesystem::path& /*root*/) {}
  virtual void on_outcome(const RenameOutcome& /*outcome*/, const BatchSummary& /*running*/) {}
  virtual void on_summary(const BatchSummary& /*summary*/) {}
};

using NullReporter = BatchReporter;
