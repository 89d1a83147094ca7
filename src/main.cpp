#include <cpptrace/cpptrace.hpp>

#include <cstdlib>
#include <filesystem>
#include <memory>

#include "batch_types.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "rename_engine.hpp"
#include "settings_manager.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitPartialFailure = 2;
constexpr int kExitCancelled = 130;

int exit_code_for(const BatchSummary& summary) {
  if(summary.state == BatchState::Cancelled) return kExitCancelled;
  if(summary.failed > 0) return kExitPartialFailure;
  return kExitOk;
}

} // namespace

int main(int argc, char** argv){
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(std::filesystem::current_path() / ".config" / "scrubname.json");
  settings->load();

  CommandLineParser parser("scrubname");
  try {
    parser.parse(argc, argv, *settings);
  } catch(const CommandLineError& e) {
    init();
    log_error(nullptr, "{}", e.what());
    parser.usage();
    return kExitFatal;
  }

  init(settings->get<std::string>("log_level"));

  if(settings->help_requested()) {
    parser.usage();
    return kExitOk;
  }

  if(settings->save_requested()) {
    if(!settings->save()) {
      log_error(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
    } else {
      print_out(nullptr, "Settings saved to {}", settings->settings_path().string());
    }
  }

  if(settings->get<std::string>("directory").empty()) {
    if(settings->save_requested()) return kExitOk;
    log_error(nullptr, "No directory given");
    parser.usage();
    return kExitFatal;
  }

  try {
    RenameEngine engine(settings, RenameEngine::Options{});
    engine.start();
    auto summary = engine.run();
    engine.stop();
    return exit_code_for(summary);
  } catch(const std::exception& e) {
    Logger logger("scrubname-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return kExitFatal;
  }
}
