#include "batch_scheduler.hpp"
#include "collision_resolver.hpp"
#include "command_line_parser.hpp"
#include "console_reporter.hpp"
#include "directory_scanner.hpp"
#include "rename_engine.hpp"
#include "rename_executor.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using scrubname::test::TempWorkspace;
using scrubname::test::TestCase;
using scrubname::test::TestContext;
using scrubname::test::list_files;
using scrubname::test::read_file;
using scrubname::test::write_file;

namespace fs = std::filesystem;

namespace {

class RecordingReporter : public BatchReporter {
public:
  void on_outcome(const RenameOutcome& outcome, const BatchSummary&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(outcome);
  }

  std::vector<RenameOutcome> outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<RenameOutcome> outcomes_;
};

// Records every outcome and cancels the batch on the first one.
class CancelOnFirstReporter : public RecordingReporter {
public:
  explicit CancelOnFirstReporter(std::shared_ptr<CancellationToken> token)
    : token_(std::move(token)) {}

  void on_outcome(const RenameOutcome& outcome, const BatchSummary& running) override {
    RecordingReporter::on_outcome(outcome, running);
    token_->cancel();
  }

private:
  std::shared_ptr<CancellationToken> token_;
};

// Cancels the batch once a fixed number of outcomes has been folded.
class CancelAfterReporter : public BatchReporter {
public:
  CancelAfterReporter(std::shared_ptr<CancellationToken> token, std::size_t limit)
    : token_(std::move(token)), limit_(limit) {}

  void on_outcome(const RenameOutcome&, const BatchSummary& running) override {
    if(running.completed() >= limit_) token_->cancel();
  }

private:
  std::shared_ptr<CancellationToken> token_;
  std::size_t limit_;
};

RunContext make_context(TestContext& ctx, std::shared_ptr<BatchReporter> reporter = nullptr) {
  auto run = RunContext::make_default("batch-test");
  if(reporter) run.reporter = std::move(reporter);
  ctx.logs.attach(run.logger);
  return run;
}

std::vector<std::string> names_in(const std::vector<RenameOutcome>& outcomes) {
  std::vector<std::string> names;
  for(const auto& outcome : outcomes) {
    if(outcome.target) names.push_back(outcome.target->filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

bool test_colliding_names_get_suffix(TestContext& ctx) {
  TempWorkspace ws("collide");
  write_file(ws / "report.txt ", "first");
  write_file(ws / " report.txt", "second");

  BatchOptions options;
  options.workers = 2;
  BatchScheduler scheduler(SanitizationPolicy{}, options, make_context(ctx));
  auto summary = scheduler.run(ws.root());

  auto files = list_files(ws.root());
  std::vector<std::string> expected = {"report.txt", "report_1.txt"};
  std::set<std::string> contents = {read_file(ws / "report.txt"), read_file(ws / "report_1.txt")};
  return summary.state == BatchState::Completed &&
         summary.renamed == 2 &&
         summary.failed == 0 &&
         files == expected &&
         contents == std::set<std::string>{"first", "second"};
}

bool test_existing_file_is_not_overwritten(TestContext& ctx) {
  TempWorkspace ws("existing");
  write_file(ws / "My_Photo.JPG", "keep");
  write_file(ws / "My Photo!!.JPG", "move");

  BatchScheduler scheduler(SanitizationPolicy{}, BatchOptions{}, make_context(ctx));
  auto summary = scheduler.run(ws.root());

  return summary.renamed == 1 &&
         summary.unchanged == 1 &&
         read_file(ws / "My_Photo.JPG") == "keep" &&
         read_file(ws / "My_Photo_1.JPG") == "move" &&
         list_files(ws.root()).size() == 2;
}

bool test_resolver_unique_under_contention(TestContext&) {
  TempWorkspace ws("resolver");
  CollisionResolver resolver;
  constexpr std::size_t kThreads = 16;
  std::vector<fs::path> reserved(kThreads);
  std::vector<std::thread> threads;
  for(std::size_t i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]{
      auto path = resolver.reserve(ws / "report.txt");
      if(path) reserved[i] = *path;
    });
  }
  for(auto& thread : threads) thread.join();

  std::set<std::string> names;
  for(const auto& path : reserved) {
    if(path.empty()) return false;
    names.insert(path.filename().string());
  }
  if(names.size() != kThreads || !names.count("report.txt")) return false;
  for(std::size_t n = 1; n < kThreads; ++n) {
    if(!names.count("report_" + std::to_string(n) + ".txt")) return false;
  }
  return resolver.reservation_count() == kThreads;
}

bool test_resolver_skips_names_on_disk(TestContext&) {
  TempWorkspace ws("resolver_disk");
  write_file(ws / "a.txt");
  write_file(ws / "a_1.txt");
  write_file(ws / "b c.txt");

  CollisionResolver resolver;
  auto first = resolver.reserve(ws / "a.txt");
  // a file never collides with itself
  auto own = resolver.reserve(ws / "b c.txt", ws / "b c.txt");
  resolver.release(*first);

  CollisionResolver bounded(1);
  auto exhausted = bounded.reserve(ws / "a.txt");

  return first && first->filename() == "a_2.txt" &&
         own && own->filename() == "b c.txt" &&
         !resolver.is_reserved(ws / "a_2.txt") &&
         !exhausted;
}

bool test_dry_run_leaves_tree_untouched(TestContext& ctx) {
  TempWorkspace ws("dry_run");
  write_file(ws / "My Photo!!.JPG");
  write_file(ws / "report.txt ");
  write_file(ws / " report.txt");
  write_file(ws / "sub" / "inner file?.txt");
  write_file(ws / "already_fine.txt");
  auto before = list_files(ws.root());

  auto reporter = std::make_shared<RecordingReporter>();
  BatchOptions options;
  options.dry_run = true;
  options.scan.recursive = true;
  BatchScheduler scheduler(SanitizationPolicy{}, options, make_context(ctx, reporter));
  auto summary = scheduler.run(ws.root());

  auto outcomes = reporter->outcomes();
  bool all_flagged = std::all_of(outcomes.begin(), outcomes.end(), [](const RenameOutcome& o){
    return o.status != RenameStatus::Renamed || o.dry_run;
  });
  std::vector<std::string> planned = {"My_Photo.JPG", "inner_file.txt", "report.txt", "report_1.txt"};
  return list_files(ws.root()) == before &&
         summary.renamed == 4 &&
         summary.unchanged == 1 &&
         all_flagged &&
         names_in(outcomes) == planned;
}

bool test_second_pass_is_noop(TestContext& ctx) {
  TempWorkspace ws("second_pass");
  write_file(ws / "a b c.txt");
  write_file(ws / "con.txt");
  write_file(ws / "x" / "nested name!.md");
  write_file(ws / "\xef\xac\x81le.txt");

  BatchOptions options;
  options.scan.recursive = true;
  {
    BatchScheduler first(SanitizationPolicy{}, options, make_context(ctx));
    auto summary = first.run(ws.root());
    if(summary.renamed != 4) return false;
  }
  auto after_first = list_files(ws.root());

  BatchScheduler second(SanitizationPolicy{}, options, make_context(ctx));
  auto summary = second.run(ws.root());
  std::vector<std::string> expected = {"_con.txt", "a_b_c.txt", "file.txt", "x/nested_name.md"};
  return summary.renamed == 0 &&
         summary.unchanged == 4 &&
         list_files(ws.root()) == after_first &&
         after_first == expected;
}

bool test_cancellation_stops_batch(TestContext& ctx) {
  TempWorkspace ws("cancel");
  for(int i = 0; i < 100; ++i) {
    write_file(ws / ("file " + std::to_string(i) + ".txt"), std::to_string(i));
  }

  auto run = RunContext::make_default("cancel-test");
  run.reporter = std::make_shared<CancelAfterReporter>(run.cancellation, 10);
  ctx.logs.attach(run.logger);

  BatchOptions options;
  options.workers = 2;
  BatchScheduler scheduler(SanitizationPolicy{}, options, run);
  auto summary = scheduler.run(ws.root());

  // every file still exists exactly once, under its old or its new name
  auto files = list_files(ws.root());
  std::set<std::string> contents;
  for(const auto& file : files) contents.insert(read_file(ws / file));

  return summary.state == BatchState::Cancelled &&
         scheduler.state() == BatchState::Cancelled &&
         summary.completed() == summary.submitted &&
         summary.submitted < 100 &&
         summary.renamed >= 10 &&
         summary.failed == 0 &&
         files.size() == 100 &&
         contents.size() == 100;
}

bool test_task_started_after_cancel_is_skipped(TestContext& ctx) {
  TempWorkspace ws("cancel_task");
  write_file(ws / "a b.txt", "untouched");

  auto run = make_context(ctx);
  BatchScheduler scheduler(SanitizationPolicy{}, BatchOptions{}, run);
  run.cancellation->cancel();

  RenameTask task;
  task.entry.path = ws / "a b.txt";
  task.entry.name = "a b.txt";
  task.entry.extension = ".txt";
  auto outcome = scheduler.process(task);

  return outcome.status == RenameStatus::SkippedCancelled &&
         std::string(to_string(outcome.status)) == "skipped-cancelled" &&
         !outcome.target &&
         read_file(ws / "a b.txt") == "untouched" &&
         list_files(ws.root()) == std::vector<std::string>{"a b.txt"};
}

bool test_cancelled_tasks_are_counted(TestContext& ctx) {
  TempWorkspace ws("cancel_count");
  constexpr int kFiles = 200;
  for(int i = 0; i < kFiles; ++i) {
    write_file(ws / ("item " + std::to_string(i) + ".txt"), std::to_string(i));
  }

  auto run = RunContext::make_default("cancel-count-test");
  auto reporter = std::make_shared<CancelOnFirstReporter>(run.cancellation);
  run.reporter = reporter;
  ctx.logs.attach(run.logger);

  BatchOptions options;
  options.workers = 1;
  options.max_in_flight = kFiles;
  BatchScheduler scheduler(SanitizationPolicy{}, options, run);
  auto summary = scheduler.run(ws.root());

  auto outcomes = reporter->outcomes();
  std::size_t skipped = 0;
  bool skipped_untouched = true;
  for(const auto& outcome : outcomes) {
    if(outcome.status != RenameStatus::SkippedCancelled) continue;
    ++skipped;
    skipped_untouched = skipped_untouched && fs::exists(outcome.source);
  }
  std::set<std::string> contents;
  auto files = list_files(ws.root());
  for(const auto& file : files) contents.insert(read_file(ws / file));

  return summary.state == BatchState::Cancelled &&
         summary.cancelled == skipped &&
         outcomes.size() == summary.submitted &&
         summary.renamed + summary.cancelled == summary.submitted &&
         skipped_untouched &&
         files.size() == static_cast<std::size_t>(kFiles) &&
         contents.size() == static_cast<std::size_t>(kFiles);
}

bool test_permission_denied_is_task_local(TestContext& ctx) {
  TempWorkspace ws("read_only");
  write_file(ws / "open" / "free file.txt");
  write_file(ws / "locked" / "stuck file.txt");
  fs::permissions(ws / "locked", fs::perms::owner_read | fs::perms::owner_exec);

  auto reporter = std::make_shared<RecordingReporter>();
  BatchOptions options;
  options.scan.recursive = true;
  BatchScheduler scheduler(SanitizationPolicy{}, options, make_context(ctx, reporter));
  auto summary = scheduler.run(ws.root());
  fs::permissions(ws / "locked", fs::perms::owner_all);

  if(::geteuid() == 0) {
    // permission bits do not stop root
    return summary.renamed == 2 && summary.failed == 0;
  }

  auto outcomes = reporter->outcomes();
  auto denied = std::find_if(outcomes.begin(), outcomes.end(), [](const RenameOutcome& o){
    return o.status == RenameStatus::Failed && o.reason.rfind("permission denied:", 0) == 0;
  });
  return summary.state == BatchState::Completed &&
         summary.renamed == 1 &&
         summary.failed == 1 &&
         denied != outcomes.end() &&
         denied->source.filename() == "stuck file.txt" &&
         fs::exists(ws / "locked" / "stuck file.txt") &&
         fs::exists(ws / "open" / "free_file.txt");
}

bool test_hidden_files_keep_marker(TestContext& ctx) {
  TempWorkspace ws("hidden");
  write_file(ws / ".my notes.txt");
  write_file(ws / "plain file.txt");
  write_file(ws / ".cache dir" / "x y.txt");

  ScanOptions scan;
  scan.include_hidden = true;
  DirectoryScanner scanner(ws.root(), scan, make_context(ctx));
  bool flags_ok = true;
  std::size_t seen = 0;
  while(auto entry = scanner.next()) {
    ++seen;
    flags_ok = flags_ok && entry->hidden == (entry->name.front() == '.');
  }

  BatchOptions options;
  options.scan.recursive = true;
  options.scan.include_hidden = true;
  BatchScheduler scheduler(SanitizationPolicy{}, options, make_context(ctx));
  auto summary = scheduler.run(ws.root());

  std::vector<std::string> expected = {".cache dir/x_y.txt", ".my_notes.txt", "plain_file.txt"};
  return flags_ok &&
         seen == 2 &&
         summary.renamed == 3 &&
         list_files(ws.root()) == expected;
}

bool test_backup_failure_is_recoverable(TestContext& ctx) {
  TempWorkspace ws("backup");
  write_file(ws / "a b.txt", "original");
  write_file(ws / "a_b.txt", "squatter");

  auto run = make_context(ctx);
  auto resolver = std::make_shared<CollisionResolver>();
  RenameExecutor executor(resolver, run);

  RenameTask task;
  task.entry.path = ws / "a b.txt";
  task.entry.name = "a b.txt";
  task.entry.extension = ".txt";
  task.backup = true;
  auto outcome = executor.execute(task, ws / "a_b.txt");

  return outcome.status == RenameStatus::Failed &&
         outcome.backup.has_value() &&
         outcome.reason.rfind("collision:", 0) == 0 &&
         !fs::exists(ws / "a b.txt") &&
         read_file(*outcome.backup) == "original" &&
         read_file(ws / "a_b.txt") == "squatter" &&
         ctx.logs.contains("backup location");
}

bool test_backup_success_leaves_no_backup(TestContext& ctx) {
  TempWorkspace ws("backup_ok");
  write_file(ws / "a b.txt", "original");

  BatchOptions options;
  options.backup = true;
  BatchScheduler scheduler(SanitizationPolicy{}, options, make_context(ctx));
  auto summary = scheduler.run(ws.root());

  return summary.renamed == 1 &&
         list_files(ws.root()) == std::vector<std::string>{"a_b.txt"} &&
         read_file(ws / "a_b.txt") == "original";
}

bool test_move_no_replace(TestContext&) {
  TempWorkspace ws("no_replace");
  write_file(ws / "from.txt", "from");
  write_file(ws / "to.txt", "to");

  auto blocked = RenameExecutor::move_no_replace(ws / "from.txt", ws / "to.txt");
  auto moved = RenameExecutor::move_no_replace(ws / "from.txt", ws / "free.txt");
  return blocked == std::errc::file_exists &&
         !moved &&
         read_file(ws / "to.txt") == "to" &&
         read_file(ws / "free.txt") == "from" &&
         !fs::exists(ws / "from.txt");
}

bool test_scanner_filters(TestContext& ctx) {
  TempWorkspace ws("scanner");
  write_file(ws / "a.JPG");
  write_file(ws / "b.png");
  write_file(ws / "c.txt");
  write_file(ws / "noext");
  write_file(ws / ".hidden.jpg");
  write_file(ws / "sub" / "d.jpg");
  write_file(ws / ".git" / "e.jpg");

  auto collect = [&](ScanOptions options){
    DirectoryScanner scanner(ws.root(), std::move(options), make_context(ctx));
    std::vector<std::string> names;
    while(auto entry = scanner.next()) names.push_back(entry->name);
    std::sort(names.begin(), names.end());
    return names;
  };

  ScanOptions flat;
  ScanOptions images;
  images.extensions = {"jpg", ".PNG"};
  ScanOptions images_recursive = images;
  images_recursive.recursive = true;
  ScanOptions case_sensitive = images;
  case_sensitive.case_insensitive = false;

  return collect(flat) == std::vector<std::string>{"a.JPG", "b.png", "c.txt", "noext"} &&
         collect(images) == std::vector<std::string>{"a.JPG", "b.png"} &&
         collect(images_recursive) == std::vector<std::string>{"a.JPG", "b.png", "d.jpg"} &&
         collect(case_sensitive) == std::vector<std::string>{};
}

bool test_scanner_rejects_bad_root(TestContext& ctx) {
  TempWorkspace ws("bad_root");
  write_file(ws / "plain.txt");

  auto throws = [&](const fs::path& root){
    try {
      DirectoryScanner scanner(root, ScanOptions{}, make_context(ctx));
    } catch(const std::runtime_error&) {
      return true;
    }
    return false;
  };

  bool scheduler_throws = false;
  try {
    BatchScheduler scheduler(SanitizationPolicy{}, BatchOptions{}, make_context(ctx));
    scheduler.run(ws / "missing");
  } catch(const std::runtime_error&) {
    scheduler_throws = true;
  }
  return throws(ws / "missing") && throws(ws / "plain.txt") && scheduler_throws;
}

bool test_scanner_skips_unreadable_directory(TestContext& ctx) {
  TempWorkspace ws("unreadable");
  write_file(ws / "top file.txt");
  write_file(ws / "locked" / "inner.txt");
  fs::permissions(ws / "locked", fs::perms::none);

  ScanOptions options;
  options.recursive = true;
  DirectoryScanner scanner(ws.root(), options, make_context(ctx));
  std::vector<std::string> names;
  while(auto entry = scanner.next()) names.push_back(entry->name);
  std::sort(names.begin(), names.end());
  fs::permissions(ws / "locked", fs::perms::owner_all);

  if(scanner.directories_skipped() == 0) {
    // running with privileges that ignore permission bits
    return names == std::vector<std::string>{"inner.txt", "top file.txt"};
  }
  return names == std::vector<std::string>{"top file.txt"} &&
         ctx.logs.contains("Skipping directory");
}

bool test_settings_from_command_line(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser("scrubname");
  parser.parse({"photos", "--dry-run", "-r", "--types", "jpg, PNG", "-j", "3",
                "--replacement=-", "--reserved", "aux,nul", "--progress", "off", "-a"},
               settings);

  auto policy = RenameEngine::policy_from_settings(settings);
  auto options = RenameEngine::batch_options_from_settings(settings);

  bool unknown_rejected = false;
  try {
    parser.parse({"--no-such-option"}, settings);
  } catch(const CommandLineError&) {
    unknown_rejected = true;
  }
  bool bad_int_rejected = false;
  try {
    parser.parse({"--threads", "many"}, settings);
  } catch(const CommandLineError&) {
    bad_int_rejected = true;
  }

  return settings.get<std::string>("directory") == "photos" &&
         options.dry_run &&
         options.scan.recursive &&
         options.scan.extensions == std::vector<std::string>{"jpg", "PNG"} &&
         options.scan.case_insensitive &&
         options.workers == 3 &&
         options.scan.include_hidden &&
         !settings.get<bool>("progress") &&
         policy.replacement == "-" &&
         policy.reserved_names == std::vector<std::string>{"aux", "nul"} &&
         policy.max_length == 255 &&
         unknown_rejected &&
         bad_int_rejected;
}

bool test_settings_round_trip(TestContext&) {
  TempWorkspace ws("settings");
  auto path = ws / ".config" / "scrubname.json";

  SettingsManager settings;
  settings.set_settings_path(path);
  std::string error;
  if(!settings.set_from_string("file_types", "jpg,png", error)) return false;
  if(!settings.set_from_json("max_length", 64, error)) return false;
  if(!settings.set_from_string("directory", "not-persisted", error)) return false;
  if(settings.set_from_json("max_length", "sixty-four", error)) return false;
  if(!settings.save()) return false;

  SettingsManager restored;
  restored.set_settings_path(path);
  if(!restored.load()) return false;
  return restored.get<std::vector<std::string>>("file_types") == std::vector<std::string>{"jpg", "png"} &&
         restored.get<int>("max_length") == 64 &&
         restored.get<std::string>("directory").empty() &&
         restored.value_as_string("file_types") == "jpg,png";
}

bool test_engine_runs_batch(TestContext& ctx) {
  TempWorkspace ws("engine");
  write_file(ws / "Quarterly Report (final).pdf");
  write_file(ws / "notes?.txt");

  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  settings->set_from_string("directory", ws.root().string(), error);
  settings->set_from_string("file_types", "pdf", error);

  RenameEngine::Options options;
  options.handle_signals = false;
  RenameEngine engine(settings, options);
  ctx.logs.attach(engine.logger());
  engine.start();
  auto summary = engine.run();
  engine.stop();

  return summary.state == BatchState::Completed &&
         summary.scanned == 1 &&
         summary.renamed == 1 &&
         fs::exists(ws / "Quarterly_Report_(final).pdf") &&
         fs::exists(ws / "notes?.txt") &&
         ctx.logs.contains("Renamed: Quarterly Report (final).pdf -> Quarterly_Report_(final).pdf");
}

bool test_engine_cancel_before_run(TestContext& ctx) {
  TempWorkspace ws("engine_cancel");
  write_file(ws / "a b.txt");

  auto settings = std::make_shared<SettingsManager>();
  RenameEngine::Options options;
  options.handle_signals = false;
  options.reporter = std::make_shared<RecordingReporter>();
  RenameEngine engine(settings, options);
  ctx.logs.attach(engine.logger());
  engine.cancel();
  auto summary = engine.run(ws.root());

  return summary.state == BatchState::Cancelled &&
         summary.submitted == 0 &&
         fs::exists(ws / "a b.txt");
}

bool test_progress_meter_format(TestContext&) {
  ConsoleReporter reporter(nullptr, true, 10);
  return reporter.format_meter(5, 10) == "Renaming [#####.....] 5/10" &&
         reporter.format_meter(0, 0) == "Renaming [..........] 0/0" &&
         reporter.format_meter(3, 3) == "Renaming [##########] 3/3";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"colliding_names_get_suffix", test_colliding_names_get_suffix},
    {"existing_file_is_not_overwritten", test_existing_file_is_not_overwritten},
    {"resolver_unique_under_contention", test_resolver_unique_under_contention},
    {"resolver_skips_names_on_disk", test_resolver_skips_names_on_disk},
    {"dry_run_leaves_tree_untouched", test_dry_run_leaves_tree_untouched},
    {"second_pass_is_noop", test_second_pass_is_noop},
    {"cancellation_stops_batch", test_cancellation_stops_batch},
    {"task_started_after_cancel_is_skipped", test_task_started_after_cancel_is_skipped},
    {"cancelled_tasks_are_counted", test_cancelled_tasks_are_counted},
    {"permission_denied_is_task_local", test_permission_denied_is_task_local},
    {"hidden_files_keep_marker", test_hidden_files_keep_marker},
    {"backup_failure_is_recoverable", test_backup_failure_is_recoverable},
    {"backup_success_leaves_no_backup", test_backup_success_leaves_no_backup},
    {"move_no_replace", test_move_no_replace},
    {"scanner_filters", test_scanner_filters},
    {"scanner_rejects_bad_root", test_scanner_rejects_bad_root},
    {"scanner_skips_unreadable_directory", test_scanner_skips_unreadable_directory},
    {"settings_from_command_line", test_settings_from_command_line},
    {"settings_round_trip", test_settings_round_trip},
    {"engine_runs_batch", test_engine_runs_batch},
    {"engine_cancel_before_run", test_engine_cancel_before_run},
    {"progress_meter_format", test_progress_meter_format}
  };
  return scrubname::test::run_test_cases("batch", tests, argc, argv);
}
