#include "rename_executor.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

#include <utility>

namespace fs = std::filesystem;

RenameExecutor::RenameExecutor(std::shared_ptr<CollisionResolver> resolver, RunContext ctx)
  : resolver_(resolver ? std::move(resolver) : std::make_shared<CollisionResolver>()),
    ctx_(std::move(ctx)) {}

std::error_code RenameExecutor::move_no_replace(const fs::path& from, const fs::path& to) {
#if defined(__linux__) && defined(RENAME_NOREPLACE)
  if(::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
    return {};
  }
  if(errno != EINVAL && errno != ENOSYS && errno != ENOTSUP) {
    return std::error_code(errno, std::generic_category());
  }
#endif
  // link() never overwrites, so link + unlink keeps the no-replace guarantee;
  // in between the file is visible under both names, never under neither.
  if(::link(from.c_str(), to.c_str()) == 0) {
    if(::unlink(from.c_str()) == 0) return {};
    const std::error_code unlink_ec(errno, std::generic_category());
    if(::unlink(to.c_str()) != 0) {
      return std::error_code(errno, std::generic_category());
    }
    return unlink_ec;
  }
  if(errno == EEXIST) return std::make_error_code(std::errc::file_exists);
  if(errno != EPERM && errno != ENOTSUP && errno != EOPNOTSUPP) {
    return std::error_code(errno, std::generic_category());
  }

  // No hard links on this filesystem (FAT and friends): check, then rename.
  std::error_code ec;
  if(fs::exists(fs::symlink_status(to, ec))) {
    return std::make_error_code(std::errc::file_exists);
  }
  if(ec && ec != std::errc::no_such_file_or_directory) return ec;
  ec.clear();
  fs::rename(from, to, ec);
  return ec;
}

std::string RenameExecutor::describe_failure(const std::error_code& ec, const fs::path& target) {
  if(ec == std::errc::file_exists) {
    return "collision: '" + target.filename().string() + "' appeared before the rename was committed";
  }
  if(ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return "permission denied: " + ec.message();
  }
  return ec.message();
}

RenameOutcome RenameExecutor::execute(const RenameTask& task, const fs::path& resolved_target) {
  const auto& source = task.entry.path;
  if(resolved_target == source) {
    return RenameOutcome::skipped(RenameStatus::SkippedUnchanged, source);
  }

  if(task.dry_run) {
    if(ctx_.logger) {
      ctx_.logger->debug("[dry run] {} -> {}", source.string(), resolved_target.filename().string());
    }
    return RenameOutcome::renamed(source, resolved_target, true);
  }

  if(task.backup) {
    return execute_with_backup(task, resolved_target);
  }

  auto ec = move_no_replace(source, resolved_target);
  if(ec) {
    auto outcome = RenameOutcome::failed(source, describe_failure(ec, resolved_target));
    outcome.target = resolved_target;
    return outcome;
  }
  return RenameOutcome::renamed(source, resolved_target);
}

RenameOutcome RenameExecutor::execute_with_backup(const RenameTask& task, const fs::path& target) {
  const auto& source = task.entry.path;
  const auto desired_backup = source.parent_path() / (source.filename().string() + kBackupMarker);
  auto backup = resolver_->reserve(desired_backup, source);
  if(!backup) {
    return RenameOutcome::failed(source, "no free backup name for '" + source.filename().string() + "'");
  }

  auto ec = move_no_replace(source, *backup);
  if(ec) {
    resolver_->release(*backup);
    auto outcome = RenameOutcome::failed(source, "backup failed: " + describe_failure(ec, *backup));
    outcome.target = target;
    return outcome;
  }

  ec = move_no_replace(*backup, target);
  if(ec) {
    // The file stays where it is; its backup reservation is kept since the
    // path is occupied now.
    auto outcome = RenameOutcome::failed(source, describe_failure(ec, target) +
                                         "; file left at backup '" + backup->string() + "'");
    outcome.target = target;
    outcome.backup = *backup;
    log_warn(ctx_.logger.get(), "{} left at backup location {}", source.string(), backup->string());
    return outcome;
  }

  resolver_->release(*backup);
  return RenameOutcome::renamed(source, target);
}
