#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_out_logger;
std::shared_ptr<spdlog::logger> g_err_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out_sink->set_pattern("%H:%M:%S - %^%l%$ - %v");

  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_pattern("%H:%M:%S - %^%l%$ - %v");

  auto plain_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_sink->set_pattern("%v");

  g_out_logger = std::make_shared<spdlog::logger>("scrubname.out", std::move(out_sink));
  g_err_logger = std::make_shared<spdlog::logger>("scrubname.err", std::move(err_sink));
  g_print_logger = std::make_shared<spdlog::logger>("scrubname.print", std::move(plain_sink));

  g_out_logger->flush_on(spdlog::level::info);
  g_err_logger->flush_on(spdlog::level::warn);
  g_print_logger->flush_on(spdlog::level::info);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string& level) {
  std::string lowered = level;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  if(lowered == "warning") return spdlog::level::warn;
  if(lowered == "fatal") return spdlog::level::critical;
  // from_str maps unknown names to off; fall back to info instead
  auto parsed = spdlog::level::from_str(lowered);
  if(parsed == spdlog::level::off && lowered != "off") return spdlog::level::info;
  return parsed;
}

void init(const std::string& level) {
  ensure_loggers();
  auto parsed = parse_log_level(level);
  g_out_logger->set_level(parsed);
  g_err_logger->set_level(parsed);
  g_print_logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(g_out_logger);
  spdlog::set_level(parsed);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit("error", spdlog::level::err,
                   fmt::format("log listener on '{}' threw: {}", channel, e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit(const char* channel,
          spdlog::level::level_enum level,
          const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  if(std::strcmp(channel, "print") == 0) {
    g_print_logger->log(level, message);
  } else if(level >= spdlog::level::warn) {
    g_err_logger->log(level, message);
  } else {
    g_out_logger->log(level, message);
  }
}

} // namespace detail
