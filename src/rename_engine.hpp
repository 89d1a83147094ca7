#pragma once

#include <asio.hpp>

#include <filesystem>
#include <memory>
#include <thread>

#include "batch_scheduler.hpp"
#include "batch_types.hpp"
#include "cancellation.hpp"
#include "log.hpp"
#include "sanitizer.hpp"

class SettingsManager;
class BatchReporter;

// Turns settings into a policy and batch options, runs one batch and owns the
// signal watcher that cancels it.
class RenameEngine {
public:
  struct Options {
    bool handle_signals = true;
    std::shared_ptr<BatchReporter> reporter;  // console reporter when null
  };

  RenameEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~RenameEngine();

  RenameEngine(const RenameEngine&) = delete;
  RenameEngine& operator=(const RenameEngine&) = delete;

  void start();
  BatchSummary run();
  BatchSummary run(const std::filesystem::path& root);
  void stop();

  // Same effect as SIGINT.
  void cancel();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<CancellationToken> cancellation() const { return cancellation_; }

  // Throws std::invalid_argument for settings no Sanitizer accepts.
  static SanitizationPolicy policy_from_settings(const SettingsManager& settings);
  static BatchOptions batch_options_from_settings(const SettingsManager& settings);

private:
  void start_signal_watch();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<CancellationToken> cancellation_;
  asio::io_context io_;
  std::unique_ptr<asio::signal_set> signals_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  bool started_ = false;
};
