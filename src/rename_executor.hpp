#pragma once

#include <filesystem>
#include <memory>
#include <system_error>

#include "batch_types.hpp"
#include "collision_resolver.hpp"
#include "run_context.hpp"

// Appended to the original filename while a file sits at its backup location.
inline constexpr char kBackupMarker[] = ".scrubname-bak";

class RenameExecutor {
public:
  RenameExecutor(std::shared_ptr<CollisionResolver> resolver, RunContext ctx);

  // Commit (or simulate) the move of task.entry.path to resolved_target.
  RenameOutcome execute(const RenameTask& task, const std::filesystem::path& resolved_target);

  // Atomic move that fails with errc::file_exists instead of replacing `to`.
  static std::error_code move_no_replace(const std::filesystem::path& from,
                                         const std::filesystem::path& to);

private:
  RenameOutcome execute_with_backup(const RenameTask& task, const std::filesystem::path& target);
  static std::string describe_failure(const std::error_code& ec, const std::filesystem::path& target);

  std::shared_ptr<CollisionResolver> resolver_;
  RunContext ctx_;
};
