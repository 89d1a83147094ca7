#pragma once

#include <memory>
#include <string>

#include "batch_reporter.hpp"
#include "cancellation.hpp"
#include "log.hpp"

// Everything a batch shares with its collaborators, passed explicitly instead
// of living in globals.
struct RunContext {
  std::shared_ptr<Logger> logger;
  std::shared_ptr<CancellationToken> cancellation;
  std::shared_ptr<BatchReporter> reporter;

  static RunContext make_default(const std::string& logger_name = "scrubname") {
    RunContext ctx;
    ctx.logger = std::make_shared<Logger>(logger_name);
    ctx.cancellation = std::make_shared<CancellationToken>();
    ctx.reporter = std::make_shared<NullReporter>();
    return ctx;
  }

  bool cancelled() const { return cancellation && cancellation->cancelled(); }
};
