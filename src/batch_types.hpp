#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

struct FileEntry {
  std::filesystem::path path;   // absolute
  std::string name;             // filename including extension
  std::string extension;        // ".jpg", empty when none
  bool hidden = false;          // name starts with the hidden marker
};

struct RenameTask {
  FileEntry entry;
  bool dry_run = false;
  bool backup = false;
};

enum class RenameStatus {
  Renamed,
  SkippedUnchanged,
  SkippedCancelled,
  Failed
};

struct RenameOutcome {
  RenameStatus status = RenameStatus::Failed;
  std::filesystem::path source;
  std::optional<std::filesystem::path> target;
  // Set when the file was left at its backup location.
  std::optional<std::filesystem::path> backup;
  std::string reason;
  bool dry_run = false;

  static RenameOutcome renamed(std::filesystem::path source,
                               std::filesystem::path target,
                               bool dry_run = false) {
    RenameOutcome out;
    out.status = RenameStatus::Renamed;
    out.source = std::move(source);
    out.target = std::move(target);
    out.dry_run = dry_run;
    return out;
  }

  static RenameOutcome skipped(RenameStatus status, std::filesystem::path source) {
    RenameOutcome out;
    out.status = status;
    out.source = std::move(source);
    return out;
  }

  static RenameOutcome failed(std::filesystem::path source, std::string reason) {
    RenameOutcome out;
    out.status = RenameStatus::Failed;
    out.source = std::move(source);
    out.reason = std::move(reason);
    return out;
  }
};

enum class BatchState {
  Idle,
  ScanningDispatching,
  Draining,
  Completed,
  Cancelled
};

struct BatchSummary {
  std::size_t scanned = 0;
  std::size_t submitted = 0;
  std::size_t renamed = 0;
  std::size_t unchanged = 0;
  std::size_t cancelled = 0;
  std::size_t failed = 0;
  std::chrono::milliseconds elapsed{0};
  BatchState state = BatchState::Idle;

  std::size_t completed() const { return renamed + unchanged + cancelled + failed; }
};

const char* to_string(RenameStatus status);
const char* to_string(BatchState state);
