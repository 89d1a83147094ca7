#include "batch_scheduler.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

namespace {

std::size_t resolve_worker_count(std::size_t requested) {
  if(requested > 0) return requested;
  auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 4 : static_cast<std::size_t>(hw);
}

RunContext complete_context(RunContext ctx) {
  if(!ctx.logger) ctx.logger = std::make_shared<Logger>("scrubname");
  if(!ctx.cancellation) ctx.cancellation = std::make_shared<CancellationToken>();
  if(!ctx.reporter) ctx.reporter = std::make_shared<NullReporter>();
  return ctx;
}

} // namespace

BatchScheduler::BatchScheduler(SanitizationPolicy policy, BatchOptions options, RunContext ctx)
  : sanitizer_(std::move(policy)),
    options_(std::move(options)),
    ctx_(complete_context(std::move(ctx))),
    workers_(resolve_worker_count(options_.workers)),
    resolver_(std::make_shared<CollisionResolver>()),
    executor_(resolver_, ctx_) {
  if(options_.max_in_flight == 0) {
    options_.max_in_flight = workers_ * 4;
  }
}

RenameOutcome BatchScheduler::process(const RenameTask& task) {
  const auto& entry = task.entry;
  if(ctx_.cancelled()) {
    return RenameOutcome::skipped(RenameStatus::SkippedCancelled, entry.path);
  }

  auto safe_name = entry.hidden
    ? sanitizer_.sanitize_hidden(entry.name)
    : sanitizer_.sanitize(entry.name);
  if(safe_name == entry.name) {
    return RenameOutcome::skipped(RenameStatus::SkippedUnchanged, entry.path);
  }

  auto target = resolver_->reserve(entry.path.parent_path() / safe_name, entry.path);
  if(!target) {
    return RenameOutcome::failed(entry.path, "collision: no free name derived from '" + safe_name + "'");
  }

  auto outcome = executor_.execute(task, *target);
  if(outcome.status != RenameStatus::Renamed) {
    resolver_->release(*target);
  }
  return outcome;
}

RenameOutcome BatchScheduler::run_task(const RenameTask& task) noexcept {
  try {
    return process(task);
  } catch(const std::exception& e) {
    return RenameOutcome::failed(task.entry.path, std::string("unexpected error: ") + e.what());
  }
}

void BatchScheduler::fold(BatchSummary& summary, const RenameOutcome& outcome) const {
  switch(outcome.status) {
    case RenameStatus::Renamed: ++summary.renamed; break;
    case RenameStatus::SkippedUnchanged: ++summary.unchanged; break;
    case RenameStatus::SkippedCancelled: ++summary.cancelled; break;
    case RenameStatus::Failed: ++summary.failed; break;
  }
}

BatchSummary BatchScheduler::run(const std::filesystem::path& root) {
  const auto started = std::chrono::steady_clock::now();
  BatchSummary summary;

  DirectoryScanner scanner(root, options_.scan, ctx_);
  state_ = BatchState::ScanningDispatching;
  ctx_.logger->debug("Batch on {} with {} worker(s){}{}",
                     scanner.root().string(),
                     workers_,
                     options_.dry_run ? ", dry run" : "",
                     options_.backup ? ", backup" : "");
  ctx_.reporter->on_batch_start(scanner.root());

  // Result channel: workers push, this thread folds.
  std::mutex result_mutex;
  std::condition_variable result_cv;
  std::deque<RenameOutcome> results;

  auto drain = [&](bool wait){
    std::deque<RenameOutcome> ready;
    {
      std::unique_lock<std::mutex> lock(result_mutex);
      if(wait) {
        result_cv.wait(lock, [&]{ return !results.empty(); });
      }
      ready.swap(results);
    }
    for(auto& outcome : ready) {
      fold(summary, outcome);
      ctx_.reporter->on_outcome(outcome, summary);
    }
  };

  {
    asio::thread_pool pool(workers_);

    while(true) {
      drain(false);
      while(summary.submitted - summary.completed() >= options_.max_in_flight) {
        drain(true);
      }
      if(ctx_.cancelled()) break;

      auto entry = scanner.next();
      if(!entry) break;
      ++summary.scanned;

      RenameTask task{std::move(*entry), options_.dry_run, options_.backup};
      ++summary.submitted;
      asio::post(pool, [this, task = std::move(task), &results, &result_mutex, &result_cv]() {
        auto outcome = run_task(task);
        {
          std::lock_guard<std::mutex> lock(result_mutex);
          results.push_back(std::move(outcome));
        }
        result_cv.notify_one();
      });
    }

    state_ = BatchState::Draining;
    while(summary.completed() < summary.submitted) {
      drain(true);
    }
    pool.join();
  }

  summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started);
  summary.state = ctx_.cancelled() ? BatchState::Cancelled : BatchState::Completed;
  state_ = summary.state;
  if(summary.state == BatchState::Cancelled) {
    ctx_.logger->warn("Batch cancelled after {} of {} submitted task(s)", summary.completed(), summary.submitted);
  }
  ctx_.reporter->on_summary(summary);
  return summary;
}
