#include "console_reporter.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include "utils.hpp"

ConsoleReporter::ConsoleReporter(std::shared_ptr<Logger> logger, bool show_progress, std::size_t meter_size)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>()),
    show_progress_(show_progress),
    meter_size_(std::max<std::size_t>(1, meter_size)) {}

void ConsoleReporter::on_batch_start(const std::filesystem::path& root) {
  root_ = root;
  logger_->info("Processing files in: {}", root.string());
}

std::string ConsoleReporter::format_meter(std::size_t done, std::size_t total) const {
  std::size_t filled = total == 0 ? 0 : (done * meter_size_) / total;
  filled = std::min(filled, meter_size_);
  std::string bar(filled, '#');
  bar.append(meter_size_ - filled, '.');
  std::ostringstream line;
  line << "Renaming [" << bar << "] " << done << "/" << total;
  return line.str();
}

void ConsoleReporter::clear_meter() {
  if(!show_progress_ || meter_line_width_ == 0) return;
  std::cout << "\r" << std::string(meter_line_width_, ' ') << "\r" << std::flush;
  meter_line_width_ = 0;
}

void ConsoleReporter::draw_meter(const BatchSummary& running) {
  if(!show_progress_ || !log_passthrough()) return;
  auto rendered = format_meter(running.completed(), running.submitted);
  std::cout << "\r" << rendered;
  if(rendered.size() < meter_line_width_) {
    std::cout << std::string(meter_line_width_ - rendered.size(), ' ');
  } else {
    meter_line_width_ = rendered.size();
  }
  std::cout.flush();
}

void ConsoleReporter::on_outcome(const RenameOutcome& outcome, const BatchSummary& running) {
  clear_meter();
  const auto from = outcome.source.filename().string();
  const auto to = outcome.target ? outcome.target->filename().string() : std::string();
  switch(outcome.status) {
    case RenameStatus::Renamed:
      if(outcome.dry_run) {
        logger_->info("[Dry Run] {} -> {}", from, to);
      } else {
        logger_->info("Renamed: {} -> {}", from, to);
      }
      break;
    case RenameStatus::SkippedUnchanged:
      logger_->debug("Unchanged: {}", outcome.source.string());
      break;
    case RenameStatus::SkippedCancelled:
      logger_->debug("Cancelled before start: {}", outcome.source.string());
      break;
    case RenameStatus::Failed:
      if(outcome.backup) {
        logger_->error("Failed: {} ({}); recover from {}", outcome.source.string(), outcome.reason,
                       outcome.backup->string());
      } else {
        logger_->error("Failed: {} ({})", outcome.source.string(), outcome.reason);
      }
      break;
  }
  draw_meter(running);
}

void ConsoleReporter::on_summary(const BatchSummary& summary) {
  clear_meter();
  if(summary.scanned == 0 && summary.state == BatchState::Completed) {
    logger_->warn("No matching files found in {}.", root_.string());
    return;
  }
  if(summary.state == BatchState::Cancelled) {
    logger_->warn("Operation cancelled by user.");
  }
  logger_->info("{} - Total: {}, Renamed: {}, Unchanged: {}, Failed: {}, Not started: {}, Time: {}",
                summary.state == BatchState::Cancelled ? "Cancelled" : "Completed",
                summary.scanned,
                summary.renamed,
                summary.unchanged,
                summary.failed,
                summary.cancelled,
                format_elapsed(summary.elapsed));
}
