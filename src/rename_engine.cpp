#include "rename_engine.hpp"

#include <csignal>
#include <stdexcept>
#include <string>
#include <vector>

#include "console_reporter.hpp"
#include "run_context.hpp"
#include "settings_manager.hpp"

namespace {

std::size_t non_negative(int value, const char* key) {
  if(value < 0) {
    throw std::invalid_argument(std::string(key) + " must not be negative");
  }
  return static_cast<std::size_t>(value);
}

} // namespace

RenameEngine::RenameEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("scrubname")),
    cancellation_(std::make_shared<CancellationToken>()) {}

RenameEngine::~RenameEngine() {
  stop();
}

SanitizationPolicy RenameEngine::policy_from_settings(const SettingsManager& settings) {
  SanitizationPolicy policy;
  policy.replacement = settings.get<std::string>("replacement");
  policy.illegal_chars = settings.get<std::string>("illegal_chars");
  policy.normalize_unicode = settings.get<bool>("normalize_unicode");
  policy.collapse_replacement = settings.get<bool>("collapse_replacement");
  policy.max_length = non_negative(settings.get<int>("max_length"), "max_length");
  policy.reserved_names = settings.get<std::vector<std::string>>("reserved_names");
  return policy;
}

BatchOptions RenameEngine::batch_options_from_settings(const SettingsManager& settings) {
  BatchOptions options;
  options.scan.recursive = settings.get<bool>("recursive");
  options.scan.extensions = settings.get<std::vector<std::string>>("file_types");
  options.scan.case_insensitive = !settings.get<bool>("case_sensitive");
  options.scan.include_hidden = settings.get<bool>("include_hidden");
  options.dry_run = settings.get<bool>("dry_run");
  options.backup = settings.get<bool>("backup");
  options.workers = non_negative(settings.get<int>("threads"), "threads");
  return options;
}

void RenameEngine::start() {
  if(started_) return;
  started_ = true;
  if(options_.handle_signals) {
    start_signal_watch();
  }
}

void RenameEngine::start_signal_watch() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    logger_->warn("Received signal {}, finishing tasks in flight", signal_number);
    cancellation_->cancel();
  });
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
    asio::make_work_guard(io_));
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

BatchSummary RenameEngine::run() {
  auto directory = settings_->get<std::string>("directory");
  if(directory.empty()) {
    throw std::invalid_argument("No directory given");
  }
  return run(std::filesystem::path(directory));
}

BatchSummary RenameEngine::run(const std::filesystem::path& root) {
  if(!started_) start();

  RunContext ctx;
  ctx.logger = logger_;
  ctx.cancellation = cancellation_;
  ctx.reporter = options_.reporter;
  if(!ctx.reporter) {
    ctx.reporter = std::make_shared<ConsoleReporter>(
      logger_,
      settings_->get<bool>("progress"),
      non_negative(settings_->get<int>("progress_meter_size"), "progress_meter_size"));
  }

  BatchScheduler scheduler(policy_from_settings(*settings_),
                           batch_options_from_settings(*settings_),
                           ctx);
  logger_->debug("Using {} worker thread(s)", scheduler.worker_count());
  return scheduler.run(root);
}

void RenameEngine::cancel() {
  cancellation_->cancel();
}

void RenameEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  signals_.reset();
  io_.restart();
}
