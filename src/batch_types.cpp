#include "batch_types.hpp"

const char* to_string(RenameStatus status) {
  switch(status) {
    case RenameStatus::Renamed: return "renamed";
    case RenameStatus::SkippedUnchanged: return "skipped-unchanged";
    case RenameStatus::SkippedCancelled: return "skipped-cancelled";
    case RenameStatus::Failed: return "failed";
  }
  return "unknown";
}

const char* to_string(BatchState state) {
  switch(state) {
    case BatchState::Idle: return "idle";
    case BatchState::ScanningDispatching: return "scanning";
    case BatchState::Draining: return "draining";
    case BatchState::Completed: return "completed";
    case BatchState::Cancelled: return "cancelled";
  }
  return "unknown";
}
