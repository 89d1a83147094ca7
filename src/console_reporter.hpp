#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "batch_reporter.hpp"
#include "log.hpp"

// Logs one line per file and keeps a single-line progress meter on stdout.
class ConsoleReporter : public BatchReporter {
public:
  ConsoleReporter(std::shared_ptr<Logger> logger, bool show_progress, std::size_t meter_size = 40);

  void on_batch_start(const std::filesystem::path& root) override;
  void on_outcome(const RenameOutcome& outcome, const BatchSummary& running) override;
  void on_summary(const BatchSummary& summary) override;

  std::string format_meter(std::size_t done, std::size_t total) const;

private:
  void clear_meter();
  void draw_meter(const BatchSummary& running);

  std::shared_ptr<Logger> logger_;
  bool show_progress_ = true;
  std::size_t meter_size_ = 40;
  std::size_t meter_line_width_ = 0;
  std::filesystem::path root_;
};
